#pragma once

#include "rdt_config.hh"

#include <iostream>
#include <optional>
#include <string>

// Which peer a configuration is for; decides which parameters are asked for interactively
enum class Role
{
  Client,
  Server
};

/*
 * Read "key: value" lines into `cfg`. Keys are case-insensitive, may use spaces,
 * dashes or underscores, and accept the aliases of both peers' files. Quotes
 * around values are stripped, lines without ':' and unknown keys are skipped,
 * and a bad value for a known key is reported on `diagnostics` and otherwise ignored.
 */
void parse_config( std::istream& in, RDTConfig& cfg, std::ostream& diagnostics = std::cerr );

// Load the file at `path`, or the empty optional if it cannot be opened
std::optional<RDTConfig> load_config_file( const std::string& path, std::ostream& diagnostics = std::cerr );

// Ask for the role's parameters one per line; an empty or invalid answer keeps the default
RDTConfig prompt_config( Role role, std::istream& in, std::ostream& out );
