#pragma once
#include <string>
#include <utility>

namespace dist {

enum class ErrorCode {
    None = 0,
    FileNotFound,
    XmlParseError,
    MissingMandatoryField,
    InvalidInput,
    CapacityInfeasible,
    Overload,
    LogicError,
};

inline const char* toString(ErrorCode c) {
    switch (c) {
    case ErrorCode::None: return "None";
    case ErrorCode::FileNotFound: return "FileNotFound";
    case ErrorCode::XmlParseError: return "XmlParseError";
    case ErrorCode::MissingMandatoryField: return "MissingMandatoryField";
    case ErrorCode::InvalidInput: return "InvalidInput";
    case ErrorCode::CapacityInfeasible: return "CapacityInfeasible";
    case ErrorCode::Overload: return "Overload";
    case ErrorCode::LogicError: return "LogicError";
    }
    return "?";
}

struct Error {
    ErrorCode code {ErrorCode::None};
    std::string message;

    // "CapacityInfeasible: meter 3_0 ..."
    std::string describe() const { return std::string(toString(code)) + ": " + message; }
};

// Préfixe le message avec le contexte d'appel ("loadProject: ...")
inline Error withContext(const std::string& where, const Error& e) {
    return Error{e.code, where + ": " + e.message};
}

template<typename T>
class Result {
public:
    Result(const T& value) : ok_(true), value_(value) {}
    Result(T&& value) : ok_(true), value_(std::move(value)) {}
    Result(Error e) : ok_(false), err_(std::move(e)) {}

    static Result Fail(ErrorCode code, std::string message) {
        return Result(Error{code, std::move(message)});
    }

    explicit operator bool() const { return ok_; }
    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return err_; }

    const T* operator->() const { return &value_; }
    T* operator->() { return &value_; }

private:
    bool ok_ = false;
    T value_{};
    Error err_{};
};

class Status {
public:
    Status() = default; // OK
    explicit Status(Error e) : ok_(false), err_(std::move(e)) {}
    static Status Ok() { return Status(); }

    static Status Fail(ErrorCode code, std::string message) {
        return Status(Error{code, std::move(message)});
    }

    explicit operator bool() const { return ok_; }
    const Error& error() const { return err_; }
private:
    bool ok_ = true;
    Error err_{};
};

} // namespace dist
