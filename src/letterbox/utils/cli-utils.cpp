#include "cli-utils.hpp"

#include "base-include.hpp"

#include <stdexcept>

namespace letterbox::cli
{
// ---------------------------------------------------------------- safe-arg-str
/**
 * @ingroup cli
 * @brief Get the argument after `i` from command line arguments `argc` and
 *        `argv`. `i` must be in the range `[0..argc)`. If `i+1 == argc`
 *        then an exception is thrown.
 *
 * Preconditions:
 * + `argc` and `argv` describe an array of `char *` "c" strings.
 * + `i >= 0` and `i < argc`
 *
 * Postconditions:
 * + `i = i + 1`, i.e., ready to parse the next argument.
 *
 * Exceptions
 * + `std::runtime_error` if `i+1 >= argc`.
 */
std::string safe_arg_str(int argc, char** argv, int& i)
{
   Expects(argc >= 0);
   Expects(i >= 0 && i < argc);
   const std::string_view arg = argv[i];
   ++i;

   if(i >= argc) throw std::runtime_error(format("expected string after argument '{}'", arg));

   return std::string(argv[i]);
}

// ---------------------------------------------------------------- safe-arg-int
/**
 * @ingroup cli
 * @brief Parse the argument (as an integer) after `i` from command line
 *        arguments `argc` and `argv`, which must lie in `[min_value..max_value]`.
 *
 * Postconditions:
 * + `i = i + 1`, i.e., ready to parse the next argument.
 *
 * Exceptions
 * + `std::runtime_error` if `i+1 >= argc`, if `argv[i+1]` cannot be
 *   parsed as an integer, or if it is out of range.
 */
int safe_arg_int(int argc, char** argv, int& i, int min_value, int max_value)
{
   Expects(argc >= 0);
   Expects(i >= 0 && i < argc);
   Expects(min_value <= max_value);
   const std::string_view arg = argv[i];
   ++i;

   if(i >= argc) throw std::runtime_error(format("expected integer after argument '{}'", arg));

   char* end           = nullptr;
   const auto long_ret = std::strtol(argv[i], &end, 10);
   if(end == argv[i] || *end != '\0')
      throw std::runtime_error(
         format("expected integer after argument '{}', but got '{}'", arg, argv[i]));

   if(long_ret < min_value || long_ret > max_value)
      throw std::runtime_error(format("argument '{}' must be in the range [{}..{}], but got {}",
                                      arg,
                                      min_value,
                                      max_value,
                                      long_ret));

   return static_cast<int>(long_ret);
}

} // namespace letterbox::cli
