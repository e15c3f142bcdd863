#include "Trash.hpp"
#include "Logger.hpp"

#include <QFile>
#include <QString>

bool SystemTrash::move_to_trash(const std::string& path, std::string* error)
{
    auto logger = Logger::get_logger("core_logger");
    const QString file_path = QString::fromStdString(path);

    QFile file(file_path);
    if (!file.exists()) {
        if (error) {
            *error = "file does not exist";
        }
        return false;
    }

    QString trashed_path;
    if (!QFile::moveToTrash(file_path, &trashed_path)) {
        const std::string reason = file.errorString().isEmpty()
            ? std::string("no trash available for this location")
            : file.errorString().toStdString();
        if (error) {
            *error = reason;
        }
        if (logger) {
            logger->error("Failed to move '{}' to the trash: {}", path, reason);
        }
        return false;
    }

    if (logger) {
        logger->info("Moved '{}' to the trash ({})", path, trashed_path.toStdString());
    }
    return true;
}
