#pragma once

#include <yaml-cpp/yaml.h>
#include <string>
#include <vector>

namespace btt {

// Deep merge of a user file over the built-in defaults.
// Mappings recurse, sequences and scalars from the overlay replace the base.
// Overlay keys that have no counterpart in the base are not merged; their
// dotted paths are appended to unknownKeys so the caller can report them.
inline YAML::Node mergeYaml(const YAML::Node& base, const YAML::Node& overlay,
                            std::vector<std::string>& unknownKeys,
                            const std::string& prefix = std::string())
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(base);

    if (base.IsMap() && overlay.IsMap()) {
        YAML::Node result = YAML::Clone(base);
        for (auto it = overlay.begin(); it != overlay.end(); ++it) {
            const auto key = it->first.as<std::string>();
            const auto path = prefix.empty() ? key : prefix + "." + key;
            if (base[key])
                result[key] = mergeYaml(base[key], it->second, unknownKeys, path);
            else
                unknownKeys.push_back(path);
        }
        return result;
    }

    return YAML::Clone(overlay);
}

} // namespace btt
