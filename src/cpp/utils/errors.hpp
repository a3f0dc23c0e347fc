#pragma once
// Error taxonomy.
// Per-operation failures are data (a failed OperationResult); only
// configuration, connection, capability and setup problems are thrown.
#include <stdexcept>
#include <string>
#include <vector>

namespace docbench {

class DocbenchError : public std::runtime_error {
public:
    explicit DocbenchError(const std::string& message) : std::runtime_error(message) {}
};

struct ValidationError {
    std::string field;
    std::string message;
};

inline std::string join_validation_errors(const std::vector<ValidationError>& errors) {
    std::string out;
    for (const auto& e : errors) {
        if (!out.empty()) out += "; ";
        out += e.field + ": " + e.message;
    }
    return out;
}

// Carries every validation problem, not only the first one found
class ConfigurationError : public DocbenchError {
public:
    explicit ConfigurationError(std::vector<ValidationError> errors)
        : DocbenchError("Configuration validation failed: " + join_validation_errors(errors))
        , errors_(std::move(errors)) {}

    ConfigurationError(const std::string& field, const std::string& message)
        : ConfigurationError(std::vector<ValidationError>{{field, message}}) {}

    [[nodiscard]] const std::vector<ValidationError>& errors() const noexcept { return errors_; }

private:
    std::vector<ValidationError> errors_;
};

class ConnectionError : public DocbenchError {
public:
    ConnectionError(std::string adapter_id, const std::string& message)
        : DocbenchError("[" + adapter_id + "] " + message)
        , adapter_id_(std::move(adapter_id)) {}

    [[nodiscard]] const std::string& adapter_id() const noexcept { return adapter_id_; }

private:
    std::string adapter_id_;
};

class OperationError : public DocbenchError {
public:
    OperationError(std::string operation_id, std::string operation_type, const std::string& message)
        : DocbenchError(operation_type + " " + operation_id + " failed: " + message)
        , operation_id_(std::move(operation_id))
        , operation_type_(std::move(operation_type)) {}

    [[nodiscard]] const std::string& operation_id() const noexcept { return operation_id_; }
    [[nodiscard]] const std::string& operation_type() const noexcept { return operation_type_; }

private:
    std::string operation_id_;
    std::string operation_type_;
};

class CapabilityNotSupportedError : public DocbenchError {
public:
    CapabilityNotSupportedError(std::string capability, std::string adapter_id)
        : DocbenchError("Capability " + capability + " not supported by adapter: " + adapter_id)
        , capability_(std::move(capability))
        , adapter_id_(std::move(adapter_id)) {}

    [[nodiscard]] const std::string& capability() const noexcept { return capability_; }
    [[nodiscard]] const std::string& adapter_id() const noexcept { return adapter_id_; }

private:
    std::string capability_;
    std::string adapter_id_;
};

class SetupError : public DocbenchError {
public:
    explicit SetupError(const std::string& message) : DocbenchError(message) {}
};

} // namespace docbench
