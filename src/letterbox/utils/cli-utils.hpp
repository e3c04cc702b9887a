#pragma once

#include <string>
#include <string_view>

/**
 * @defgroup cli Command Line Utils
 * @ingroup letterbox-utils
 *
 * The `letterbox` method for parsing command-line arguments: walk `argv` with an index,
 * and pull the value that follows a switch with one of the `safe_arg_*` functions.
 */

namespace letterbox::cli
{
std::string safe_arg_str(int argc, char** argv, int& i);
int safe_arg_int(int argc, char** argv, int& i, int min_value, int max_value);

/**
 * @ingroup cli
 * @brief True iff `arg` equals the short or the long form of a switch.
 */
inline bool is_switch(std::string_view arg, std::string_view short_form,
                      std::string_view long_form = {})
{
   return arg == short_form || (!long_form.empty() && arg == long_form);
}

} // namespace letterbox::cli
