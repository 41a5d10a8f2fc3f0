#include "hunkwise/fs.hpp"

#include <fstream>
#include <optional>
#include <stdexcept>

namespace hunkwise::fs {

std::string resolve_from(const std::filesystem::path &base, std::string_view arg) {
  const std::filesystem::path p{arg};
  if (p.is_absolute())
    return p.lexically_normal().string();
  return (base / p).lexically_normal().string();
}

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  if (!p.has_parent_path())
    return;
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw std::runtime_error("mkdir -p failed: " + ec.message());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  return buf;
}

std::string read_text(const std::filesystem::path &p) {
  const auto bytes = read_file(p);
  return {bytes.begin(), bytes.end()};
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);

  std::optional<std::filesystem::perms> perms;
  {
    std::error_code ec;
    const auto st = std::filesystem::status(p, ec);
    if (!ec && std::filesystem::is_regular_file(st))
      perms = st.permissions();
  }

  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw std::runtime_error("open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs)
      throw std::runtime_error("flush temp failed: " + tmp.string());
  }
  std::error_code ec;
  if (perms) {
    std::filesystem::permissions(tmp, *perms, ec);
    ec.clear();
  }
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::filesystem::remove(p, ec);
    std::filesystem::rename(tmp, p, ec);
    if (ec) {
      std::filesystem::remove(tmp);
      throw std::runtime_error("atomic replace failed: " + p.string() + ": " + ec.message());
    }
  }
}

void write_text_atomic(const std::filesystem::path &p, std::string_view text) {
  const auto *data = reinterpret_cast<const std::uint8_t *>(text.data());
  write_file_atomic(p, std::span(data, text.size()));
}

void remove_file(const std::filesystem::path &p) {
  std::error_code ec;
  if (!std::filesystem::remove(p, ec) || ec) {
    throw std::runtime_error("remove failed: " + p.string() +
                             (ec ? ": " + ec.message() : std::string{}));
  }
}

} // namespace hunkwise::fs
