#ifndef FOLDER_CATALOG_HPP
#define FOLDER_CATALOG_HPP

#include "Types.hpp"

#include <string>
#include <vector>

/**
 * @brief Lists and creates user folders below YEAR/ in the camera folder.
 */
class FolderCatalog {
public:
    explicit FolderCatalog(std::string root);

    // Organized (non-reserved) folders of one year, sorted by name.
    std::vector<OrganizedFolder> list_folders(int year) const;

    // Creates YEAR/NAME/ if needed and returns it. Throws ErrorCodes::AppException
    // for invalid names, invalid years, or when the directory cannot be created.
    OrganizedFolder create_folder(int year, const std::string& name) const;

    // Pastel "#rrggbb" that depends only on the name.
    static std::string color_tag_for(const std::string& name);

    static bool is_valid_folder_name(const std::string& name);

private:
    std::string root;
};

#endif
