#include "cli_shared.hpp"

#include <iostream>
#include <sstream>

namespace trip_atlas::cli {

TeeBuf::TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
  if (c == EOF)
    return EOF;
  const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
  const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
  return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
  int ra = a_ ? a_->pubsync() : 0;
  int rb = b_ ? b_->pubsync() : 0;
  return (ra == 0 && rb == 0) ? 0 : -1;
}

void print_json(const nlohmann::json &j, int indent) {
  std::cout << j.dump(indent) << std::endl;
}

std::string format_counts(const nlohmann::json &stats) {
  std::ostringstream oss;
  bool first = true;
  for (const auto &[key, value] : stats.items()) {
    if (!first)
      oss << ", ";
    oss << key << "=" << value.dump();
    first = false;
  }
  return oss.str();
}

} // namespace trip_atlas::cli
