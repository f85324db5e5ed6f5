#ifndef LAB_CATALOG_H
#define LAB_CATALOG_H

#include <optional>
#include <string>
#include <vector>
#include "Config.h"
#include "nlohmann/json.hpp"

/**
 * @class LabCatalog
 * @brief Read-only view over the configured lab types.
 */
class LabCatalog {
public:
    explicit LabCatalog(std::vector<LabTypeDefinition> labs);

    std::optional<LabTypeDefinition> find(const std::string& id) const;
    bool contains(const std::string& id) const;
    const std::vector<LabTypeDefinition>& all() const { return labs_; }

    // Comma separated ids, for "unknown lab type" hints.
    std::string ids() const;

    // Public fields only: id, name, category, difficulty, port, description.
    nlohmann::json to_json() const;

    // dvwa, webgoat, juice-shop, metasploitable, crypto-lab, forensics-lab.
    static std::vector<LabTypeDefinition> builtin();

private:
    std::vector<LabTypeDefinition> labs_;
};

#endif // LAB_CATALOG_H
