#ifndef CONFIG_PARSER_H
#define CONFIG_PARSER_H

#include "Config.h"
#include <string>

class ConfigParser {
public:
    // Overlays the JSON file onto out_config; keys that are absent keep their current value.
    static bool parse_json(const std::string& filepath, Config& out_config);

    // LABCTL_* environment overrides. Out-of-range values are warned about and ignored.
    static void apply_env(Config& config);

    static bool validate(const Config& config);
};

#endif // CONFIG_PARSER_H
