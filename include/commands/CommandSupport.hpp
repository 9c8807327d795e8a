#pragma once
#include "emb/Embedder.hpp"
#include "rec/RankingConfig.hpp"
#include "rec/Recommender.hpp"

#include <memory>
#include <string>

// flag helpers shared by the subcommands; argv[0] is the subcommand name

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);
bool has_flag(int argc, char** argv, const std::string& key);
bool wants_help(int argc, char** argv);

// throws std::runtime_error naming the flag on a malformed number
size_t get_size_arg(int argc, char** argv, const std::string& key, size_t def);
float get_float_arg(int argc, char** argv, const std::string& key, float def);

// --embedder minilm|hashing plus their options; throws rec::ConfigurationError
std::shared_ptr<const emb::Embedder> make_embedder(int argc, char** argv);

rec::ContextOptions context_options(int argc, char** argv);
rec::RankingConfig ranking_config(int argc, char** argv);

// help text for the flags above
const char* common_flags_help();
