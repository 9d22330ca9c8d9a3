#pragma once



#include <string>
#include "metadata/config.hh"
#include "store/entry.hh"
#include "options.hh"



namespace dsstore
{

int dsutil(Options &options);

Config config_from_options(const Options &options);
Value parse_value(const std::string &type, const std::string &text);

}
