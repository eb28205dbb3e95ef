#pragma once

#include <system_error>

/**
 * @defgroup error-codes Error Codes
 * @ingroup parley-utils
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * // A second call registered under an id that is still in flight
 * return make_error_code(ecode::duplicate_id);
 * ~~~~~~~~~~~~~~~~~~~~~~
 */

namespace parley
{
using std::error_code;

/**
 * @ingroup error-codes
 * @brief Complete set of parley error codes.
 */
enum class ecode : int {
   okay = 0,           //!< i.e., everything's okay.
   logic_error,        //!< Faulty logic in the program.
   exception_occurred, //!< Exception caught and forwarded as an error_code.
   argument_error,     //!< An invalid argument was supplied.
   invalid_data,       //!< Input data (file/network/etc.) was invalid.

   connect_failure, //!< The transport failed to open.
   not_connected,   //!< A send was attempted outside the CONNECTED state.
   duplicate_id,    //!< A call id was registered while a call with that id is pending.
   decode_error,    //!< Inbound bytes are not a well-formed envelope.
   protocol_error,  //!< Well-formed response carrying a server-reported error.
   connection_lost  //!< The connection closed before the call was answered.
};
} // namespace parley

namespace std
{
template<> struct is_error_code_enum<parley::ecode> : true_type
{};
} // namespace std

namespace parley
{
error_code make_error_code(ecode);

/**
 * @ingroup error-codes
 * @brief The category of every `ecode` error_code.
 */
const std::error_category& parley_category() noexcept;
} // namespace parley
