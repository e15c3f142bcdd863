#ifndef TRASH_HPP
#define TRASH_HPP

#include <string>

/**
 * @brief Recoverable deletion. Implementations must never unlink permanently.
 */
class ITrash {
public:
    virtual ~ITrash() = default;

    // On failure, `error` (when given) receives a human readable reason.
    virtual bool move_to_trash(const std::string& path, std::string* error = nullptr) = 0;
};

/**
 * @brief Desktop recycle bin / freedesktop trash through QFile::moveToTrash.
 */
class SystemTrash : public ITrash {
public:
    bool move_to_trash(const std::string& path, std::string* error = nullptr) override;
};

#endif
