#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include <mcpcmd/core/types.h>

namespace mcpcmd::cli {

using json = nlohmann::ordered_json;

// Number, boolean or null when `text` spells one exactly; the text itself otherwise.
json coerce_scalar(std::string_view text);

/**
 * Builds the `arguments` object of a tool call from the words following the tool name.
 *
 *   --key=value, --key value   named argument, value coerced with coerce_scalar
 *   --key                      true (when no value follows)
 *   --no-key                   false
 *   -k                         single-letter flags, same rules as --key
 *   anything else              positional; all positionals are joined with spaces, parsed
 *                              as one JSON object and merged over the named arguments
 *
 * A key given more than once collects its values into an array.
 */
Result<json> build_call_arguments(const std::vector<std::string>& words);

} // namespace mcpcmd::cli
