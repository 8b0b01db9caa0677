#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>

namespace Stamp
{
    //! Thrown when a targeted lookup (e.g. a config key) has nothing to return.
    class NotFoundError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    //! Input the user has to fix: bad arguments, an unknown format, a missing folder.
    class UsageError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    class StorageError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };
} // namespace Stamp

#endif // ERRORS_H
