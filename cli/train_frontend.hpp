#pragma once

#include <string>

#include "wordbpe/config.hpp"

std::string detect_arg_value(int argc, char **argv, const std::string &flag, const std::string &default_value);
void print_train_usage();
bool parse_train_args(int argc, char **argv, wordbpe::Config &cfg, std::string &err, bool &show_help);
