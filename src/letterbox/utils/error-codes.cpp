#include "error-codes.hpp"

#include <string>

namespace letterbox
{
namespace
{
   /**
    * @private
    */
   struct ECodeCategory : std::error_category
   {
      const char* name() const noexcept override;
      std::string message(int ev) const override;
   };

   /**
    * @private
    */
   const char* ECodeCategory::name() const noexcept { return "letterbox"; }

   /**
    * @private
    */
   std::string ECodeCategory::message(int e) const
   {
      switch(static_cast<ecode>(e)) {
      case ecode::okay: return "okay";
      case ecode::logic_error: return "logic error";
      case ecode::invalid_data: return "invalid data";
      case ecode::not_an_object: return "entry is not an object";
      case ecode::missing_field: return "missing field";
      case ecode::type_error: return "type error";
      case ecode::duplicate_call_id: return "duplicate call id";
      case ecode::batch_aborted: return "batch aborted";
      case ecode::no_data_document: return "no data document";
      }
      return "(unknown error)";
   }

   /**
    * @private
    */
   static const ECodeCategory ecode_category{};
} // namespace

/**
 * @ingroup error-codes
 * @brief Make an `ecode` `std::error_code`.
 */
error_code make_error_code(ecode e) { return {static_cast<int>(e), ecode_category}; }

} // namespace letterbox
