// xdp/bind_mode.hpp
// Zero-copy / copy-mode negotiation for AF_XDP binds
//
// State machine:
//
//   UNINITIALIZED ─► ATTEMPTING_ZERO_COPY ─► ZERO_COPY_ACTIVE
//         │                    │
//         │                    ▼
//         └──────────► ATTEMPTING_COPY_MODE ─► COPY_MODE_ACTIVE
//                              │
//   (ZERO_COPY pref) ──────────┴─────────────► FAILED
//
// AUTO walks the whole chain, ZERO_COPY fails after the zero-copy attempt,
// COPY starts directly at ATTEMPTING_COPY_MODE. FAILED is reported to the
// caller as BindError so it can fall back to a conventional socket.

#pragma once

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace wraith::xdp {

enum class BindMode : uint8_t {
    ZERO_COPY = 0,
    COPY = 1
};

enum class ModePreference : uint8_t {
    AUTO = 0,
    ZERO_COPY = 1,
    COPY = 2
};

enum class NegotiationState : uint8_t {
    UNINITIALIZED = 0,
    ATTEMPTING_ZERO_COPY,
    ZERO_COPY_ACTIVE,
    ATTEMPTING_COPY_MODE,
    COPY_MODE_ACTIVE,
    FAILED
};

enum class BindFailure : uint8_t {
    NONE = 0,
    INTERFACE_NOT_FOUND,
    PERMISSION,
    UNSUPPORTED,
    RESOURCE,
    OTHER
};

inline const char* to_string(BindMode m) {
    return m == BindMode::ZERO_COPY ? "zero-copy" : "copy";
}

inline const char* to_string(ModePreference p) {
    switch (p) {
        case ModePreference::AUTO:      return "auto";
        case ModePreference::ZERO_COPY: return "zerocopy";
        case ModePreference::COPY:      return "copy";
    }
    return "unknown";
}

inline const char* to_string(NegotiationState s) {
    switch (s) {
        case NegotiationState::UNINITIALIZED:        return "UNINITIALIZED";
        case NegotiationState::ATTEMPTING_ZERO_COPY: return "ATTEMPTING_ZERO_COPY";
        case NegotiationState::ZERO_COPY_ACTIVE:     return "ZERO_COPY_ACTIVE";
        case NegotiationState::ATTEMPTING_COPY_MODE: return "ATTEMPTING_COPY_MODE";
        case NegotiationState::COPY_MODE_ACTIVE:     return "COPY_MODE_ACTIVE";
        case NegotiationState::FAILED:               return "FAILED";
    }
    return "UNKNOWN";
}

inline const char* to_string(BindFailure f) {
    switch (f) {
        case BindFailure::NONE:                return "none";
        case BindFailure::INTERFACE_NOT_FOUND: return "interface not found";
        case BindFailure::PERMISSION:          return "permission denied";
        case BindFailure::UNSUPPORTED:         return "unsupported";
        case BindFailure::RESOURCE:            return "resource unavailable";
        case BindFailure::OTHER:               return "other";
    }
    return "unknown";
}

// Map a positive errno from a failed bind to its category
inline BindFailure classify_bind_errno(int err) {
    switch (err) {
        case 0:
            return BindFailure::NONE;
        case ENODEV:
        case ENXIO:
            return BindFailure::INTERFACE_NOT_FOUND;
        case EPERM:
        case EACCES:
            return BindFailure::PERMISSION;
        case EOPNOTSUPP:
        case EINVAL:
        case EPROTONOSUPPORT:
            return BindFailure::UNSUPPORTED;
        case ENOMEM:
        case ENOBUFS:
        case EBUSY:
            return BindFailure::RESOURCE;
        default:
            return BindFailure::OTHER;
    }
}

/**
 * Parse "auto" / "zerocopy" / "zero-copy" / "copy"
 * @throws std::invalid_argument for anything else
 */
inline ModePreference parse_mode_preference(const std::string& s) {
    if (s == "auto") return ModePreference::AUTO;
    if (s == "zerocopy" || s == "zero-copy" || s == "zc") return ModePreference::ZERO_COPY;
    if (s == "copy") return ModePreference::COPY;
    throw std::invalid_argument("unknown XDP mode '" + s + "' (expected auto|zerocopy|copy)");
}

/**
 * Negotiation failed: no mode could be bound
 */
class BindError : public std::runtime_error {
public:
    BindError(const std::string& interface, uint32_t queue, NegotiationState state, int err)
        : std::runtime_error("AF_XDP bind failed on " + interface + " queue " + std::to_string(queue)
                             + " (" + to_string(classify_bind_errno(err)) + ": "
                             + strerror(err) + ", state " + to_string(state) + ")")
        , state_(state), errno_(err), failure_(classify_bind_errno(err)) {}

    NegotiationState state() const { return state_; }
    int errno_value() const { return errno_; }
    BindFailure failure() const { return failure_; }

private:
    NegotiationState state_;
    int errno_;
    BindFailure failure_;
};

/**
 * Records and validates the negotiation trail
 */
class ModeNegotiator {
public:
    ModeNegotiator() { trail_.push_back(NegotiationState::UNINITIALIZED); }

    NegotiationState state() const { return trail_.back(); }
    const std::vector<NegotiationState>& trail() const { return trail_; }
    int last_errno() const { return last_errno_; }

    bool active() const {
        return state() == NegotiationState::ZERO_COPY_ACTIVE
            || state() == NegotiationState::COPY_MODE_ACTIVE;
    }

    BindMode mode() const {
        return state() == NegotiationState::ZERO_COPY_ACTIVE ? BindMode::ZERO_COPY : BindMode::COPY;
    }

    /**
     * @throws std::logic_error for a transition the state machine does not allow
     */
    void transition(NegotiationState next) {
        if (!allowed(state(), next)) {
            throw std::logic_error(std::string("illegal negotiation transition ")
                                   + to_string(state()) + " -> " + to_string(next));
        }
        trail_.push_back(next);
    }

    /**
     * Walk the state machine for a preference
     *
     * attempt(BindMode) returns 0 on success or a negated errno.
     * @return final state (ZERO_COPY_ACTIVE, COPY_MODE_ACTIVE or FAILED)
     */
    template <typename AttemptFn>
    NegotiationState run(ModePreference pref, AttemptFn&& attempt) {
        if (pref != ModePreference::COPY) {
            transition(NegotiationState::ATTEMPTING_ZERO_COPY);
            int ret = attempt(BindMode::ZERO_COPY);
            if (ret == 0) {
                transition(NegotiationState::ZERO_COPY_ACTIVE);
                return state();
            }
            last_errno_ = -ret;
            if (pref == ModePreference::ZERO_COPY) {
                transition(NegotiationState::FAILED);
                return state();
            }
        }

        transition(NegotiationState::ATTEMPTING_COPY_MODE);
        int ret = attempt(BindMode::COPY);
        if (ret == 0) {
            transition(NegotiationState::COPY_MODE_ACTIVE);
        } else {
            last_errno_ = -ret;
            transition(NegotiationState::FAILED);
        }
        return state();
    }

    static bool allowed(NegotiationState from, NegotiationState to) {
        using S = NegotiationState;
        switch (from) {
            case S::UNINITIALIZED:
                return to == S::ATTEMPTING_ZERO_COPY || to == S::ATTEMPTING_COPY_MODE;
            case S::ATTEMPTING_ZERO_COPY:
                return to == S::ZERO_COPY_ACTIVE || to == S::ATTEMPTING_COPY_MODE || to == S::FAILED;
            case S::ATTEMPTING_COPY_MODE:
                return to == S::COPY_MODE_ACTIVE || to == S::FAILED;
            case S::ZERO_COPY_ACTIVE:
            case S::COPY_MODE_ACTIVE:
            case S::FAILED:
                return false;
        }
        return false;
    }

private:
    std::vector<NegotiationState> trail_;
    int last_errno_ = 0;
};

}  // namespace wraith::xdp
