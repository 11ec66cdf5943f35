#pragma once

#include <nlohmann/json.hpp>

#include <streambuf>
#include <string>

namespace trip_atlas::cli {

// Mirrors every character to two stream buffers; either may be null
class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

void print_json(const nlohmann::json &j, int indent);

std::string format_counts(const nlohmann::json &stats);

} // namespace trip_atlas::cli
