#pragma once

#include <boost/program_options.hpp>
#include <insure/schema/policy_payload.hpp>

namespace insure::cli {

/// Command-line and config-file options that make up a policy payload.
///
/// Dates are read as signed integers and rejected with a
/// boost::program_options::validation_error when negative, so `-5` never
/// wraps into a far-future timestamp. The check runs at
/// boost::program_options::notify.
boost::program_options::options_description make_payload_options();

/// Build a payload from parsed options. Options that were not given stay
/// absent so the registry reports them as missing fields.
insure::schema::policy_payload_t make_payload(
    const boost::program_options::variables_map& vm);

}  // namespace insure::cli
