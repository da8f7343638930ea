#ifndef CFS_PERSISTENCE_ERROR_HPP
#define CFS_PERSISTENCE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace cfs::persistence {

class SnapshotError : public std::runtime_error {
public:
    explicit SnapshotError(const std::string& message)
        : std::runtime_error(message) {}
};

// Bytes do not follow the snapshot layout
class SnapshotFormatError : public SnapshotError {
public:
    explicit SnapshotFormatError(const std::string& message)
        : SnapshotError("Format error: " + message) {}
};

// Stored digest does not match the content
class SnapshotIntegrityError : public SnapshotError {
public:
    explicit SnapshotIntegrityError(const std::string& message)
        : SnapshotError("Integrity error: " + message) {}
};

class SnapshotIOError : public SnapshotError {
public:
    explicit SnapshotIOError(const std::string& message)
        : SnapshotError("I/O error: " + message) {}
};

} // namespace cfs::persistence

#endif // CFS_PERSISTENCE_ERROR_HPP
