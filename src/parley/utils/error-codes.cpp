#include "error-codes.hpp"

#include <string>

namespace parley
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
   const char* ECodeCategory::name() const noexcept { return "parley"; }

   /**
    * @private
    */
   std::string ECodeCategory::message(int e) const
   {
      switch(static_cast<ecode>(e)) {
      case ecode::okay: return "okay";
      case ecode::logic_error: return "logic error";
      case ecode::exception_occurred: return "exception occurred";
      case ecode::argument_error: return "argument error";
      case ecode::invalid_data: return "invalid data";
      case ecode::connect_failure: return "failed to open connection";
      case ecode::not_connected: return "not connected";
      case ecode::duplicate_id: return "call id already pending";
      case ecode::decode_error: return "malformed message";
      case ecode::protocol_error: return "server reported an error";
      case ecode::connection_lost: return "connection lost";
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

const std::error_category& parley_category() noexcept { return ecode_category; }

} // namespace parley
