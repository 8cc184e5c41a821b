#include "galaxis/util/file_io.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace galaxis {

std::string read_text_file(const std::string& path) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) throw std::runtime_error("Unable to read " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) throw std::runtime_error("I/O error while reading " + path);
  return ss.str();
}

void write_text_file(const std::string& path, const std::string& contents) {
  const std::filesystem::path target(path);
  std::error_code ec;
  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) throw std::runtime_error("Unable to create directory for " + path + ": " + ec.message());
  }

  std::filesystem::path tmp = target;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Unable to write " + tmp.string());
    out << contents;
    out.flush();
    if (!out) throw std::runtime_error("I/O error while writing " + tmp.string());
  }

  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    throw std::runtime_error("Unable to replace " + path);
  }
}

} // namespace galaxis
