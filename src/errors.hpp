#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

enum class ErrorKind {
    None,
    SelectionEmpty,
    FatalConfiguration,
    CatalogFailure,
    TransientNetwork,
    UpstreamRateLimited,
    PermanentDelivery,
    PartialChapter,
    BadRequest,
    Filesystem
};

inline const char* error_kind_label(ErrorKind k) {
    switch (k) {
        case ErrorKind::None: return "None";
        case ErrorKind::SelectionEmpty: return "SelectionEmpty";
        case ErrorKind::FatalConfiguration: return "FatalConfiguration";
        case ErrorKind::CatalogFailure: return "CatalogFailure";
        case ErrorKind::TransientNetwork: return "TransientNetwork";
        case ErrorKind::UpstreamRateLimited: return "UpstreamRateLimited";
        case ErrorKind::PermanentDelivery: return "PermanentDelivery";
        case ErrorKind::PartialChapter: return "PartialChapter";
        case ErrorKind::BadRequest: return "BadRequest";
        case ErrorKind::Filesystem: return "Filesystem";
    }
    return "Unknown";
}

// Run-aborting error. Only selection, configuration and catalog lookup
// failures are raised this way; everything else stays a CallResult.
class FatalError : public std::runtime_error {
public:
    FatalError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// -------------------- tagged call results --------------------
template <class T>
struct Ok {
    T value;
};

struct RateLimited {
    std::chrono::milliseconds waitHint{0};
    std::string detail;
};

struct Failed {
    ErrorKind kind{ErrorKind::TransientNetwork};
    std::string detail;
    bool retryable{false};
};

template <class T>
using CallResult = std::variant<Ok<T>, RateLimited, Failed>;

struct Unit {};

template <class T>
CallResult<T> make_ok(T value) {
    return Ok<T>{std::move(value)};
}

inline Failed transient_failure(std::string detail) {
    return Failed{ErrorKind::TransientNetwork, std::move(detail), true};
}

inline Failed permanent_failure(ErrorKind kind, std::string detail) {
    return Failed{kind, std::move(detail), false};
}

template <class T>
bool is_ok(const CallResult<T>& r) {
    return std::holds_alternative<Ok<T>>(r);
}

// Short description of a non-Ok result for log lines.
template <class T>
std::string describe(const CallResult<T>& r) {
    return std::visit([](const auto& alt) -> std::string {
        using A = std::decay_t<decltype(alt)>;
        if constexpr (std::is_same_v<A, Ok<T>>) {
            return "ok";
        } else if constexpr (std::is_same_v<A, RateLimited>) {
            return "rate limited, retry after " + std::to_string(alt.waitHint.count()) + "ms";
        } else {
            return std::string(error_kind_label(alt.kind)) + ": " + alt.detail;
        }
    }, r);
}

// Maps an HTTP exchange onto the result variant. transportError is the
// client-side failure text (timeouts, resets), empty when a response arrived.
template <class T>
CallResult<T> classify_http_failure(long status,
                                    const std::string& transportError,
                                    std::chrono::milliseconds retryAfter,
                                    const std::string& body) {
    if (!transportError.empty()) return transient_failure("transport: " + transportError);
    if (status == 429) return RateLimited{retryAfter, "HTTP 429"};
    if (status == 0 || status >= 500) return transient_failure("HTTP " + std::to_string(status) + " " + body);
    return permanent_failure(ErrorKind::BadRequest, "HTTP " + std::to_string(status) + " " + body);
}
