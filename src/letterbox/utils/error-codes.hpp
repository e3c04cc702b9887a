#pragma once

#include <system_error>

/**
 * @defgroup error-codes Error Codes
 * @ingroup letterbox-utils
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * // The queue entry has no `id`
 * return make_unexpected(make_error_code(ecode::missing_field));
 * ~~~~~~~~~~~~~~~~~~~~~~
 */

namespace letterbox
{
using std::error_code;

/**
 * @ingroup error-codes
 * @brief Complete set of letterbox error codes.
 */
enum class ecode : int {
   okay = 0,          //!< i.e., everything's okay.
   logic_error,       //!< Faulty logic in the program.
   invalid_data,      //!< Input data (document entry, json text, etc.) was invalid.
   not_an_object,     //!< A document entry is not a json object.
   missing_field,     //!< A required field of a document entry is absent.
   type_error,        //!< A field of a document entry has the wrong type.
   duplicate_call_id, //!< A call id is already in use by a pending call.
   batch_aborted,     //!< The enclosing batch threw, and none of its calls were appended.
   no_data_document   //!< A handler asked for the data document, but none is configured.
};
} // namespace letterbox

namespace std
{
template<> struct is_error_code_enum<letterbox::ecode> : true_type
{};
} // namespace std

namespace letterbox
{
error_code make_error_code(ecode);
} // namespace letterbox
