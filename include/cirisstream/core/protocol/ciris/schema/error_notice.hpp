#pragma once

#include <string>
#include <ostream>


namespace cirisstream::core::protocol::ciris::schema {

// Server-side error notice: {"type":"error","message":"..."}
// Logged by the session, never delivered to the consumer.
struct ErrorNotice {
    std::string message;

    inline void dump(std::ostream& os) const {
        os << "[ERROR NOTICE] {message=" << message << "}";
    }
};

inline std::ostream& operator<<(std::ostream& os, const ErrorNotice& notice) {
    notice.dump(os);
    return os;
}

} // namespace cirisstream::core::protocol::ciris::schema
