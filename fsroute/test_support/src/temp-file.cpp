#include "fsroute/temp-file.hpp"

#include <unistd.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <ios>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include "fsroute/base-fd.hpp"

namespace fsroute::test {

namespace {

std::string ToHex(uint64_t value) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int pos = 15; pos >= 0; --pos) {
    out[static_cast<std::size_t>(pos)] = kHex[value & 0xFU];
    value >>= 4U;
  }
  return out;
}

std::mt19937_64& ThreadRng() {
  thread_local std::mt19937_64 engine = [] {
    std::random_device rd;
    const auto now = static_cast<uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
    const auto tid = static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    std::array<uint64_t, 3> seeds{static_cast<uint64_t>(rd()), now, tid};
    std::seed_seq seq(seeds.begin(), seeds.end());
    return std::mt19937_64(seq);
  }();
  return engine;
}

}  // namespace

ScopedTempDir::ScopedTempDir(std::string_view prefix) {
  const auto base = std::filesystem::temp_directory_path();
  std::uniform_int_distribution<uint64_t> dist;
  for (int attempt = 0; attempt < 100; ++attempt) {
    const auto candidate = base / (std::string(prefix) + ToHex(dist(ThreadRng())));
    std::error_code ec;
    if (std::filesystem::create_directories(candidate, ec)) {
      _dir = std::filesystem::canonical(candidate);
      return;
    }
  }
  throw std::runtime_error("ScopedTempDir: Failed to create temp dir");
}

ScopedTempDir::ScopedTempDir(ScopedTempDir&& other) noexcept : _dir(std::move(other._dir)) { other._dir.clear(); }

ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& other) noexcept {
  if (this != &other) {
    cleanup();
    _dir = std::move(other._dir);
    other._dir.clear();
  }
  return *this;
}

ScopedTempDir::~ScopedTempDir() { cleanup(); }

std::filesystem::path ScopedTempDir::writeFile(std::string_view relativePath, std::string_view content) const {
  const auto path = _dir / relativePath;
  std::filesystem::create_directories(path.parent_path());
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    throw std::runtime_error("ScopedTempDir: unable to create file " + path.string());
  }
  ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
  return path;
}

std::filesystem::path ScopedTempDir::makeDir(std::string_view relativePath) const {
  const auto path = _dir / relativePath;
  std::filesystem::create_directories(path);
  return path;
}

void ScopedTempDir::remove(std::string_view relativePath) const { std::filesystem::remove_all(_dir / relativePath); }

void ScopedTempDir::cleanup() noexcept {
  if (_dir.empty()) {
    return;
  }
  std::error_code ec;
  // Restore permissions removed by tests so that remove_all can descend everywhere.
  for (auto it = std::filesystem::recursive_directory_iterator(
           _dir, std::filesystem::directory_options::skip_permission_denied, ec);
       !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    if (it->is_directory(ec) && !it->is_symlink(ec)) {
      std::filesystem::permissions(it->path(), std::filesystem::perms::owner_all,
                                   std::filesystem::perm_options::add, ec);
    }
  }
  ec.clear();
  std::filesystem::remove_all(_dir, ec);
  _dir.clear();
}

ScopedTempFile::ScopedTempFile(const ScopedTempDir& dir, std::string_view content) {
  std::string tmpl = (dir.dirPath() / "fsroute_temp_XXXXXX").string();

  BaseFd raii(::mkstemp(tmpl.data()));
  if (!raii) {
    throw std::system_error(errno, std::generic_category(), "ScopedTempFile: mkstemp failed");
  }
  _path = std::filesystem::path(tmpl);

  const auto written = ::write(raii.fd(), content.data(), content.size());
  if (std::cmp_not_equal(written, content.size())) {
    const int err = errno;
    cleanup();
    throw std::system_error(err, std::generic_category(), "ScopedTempFile: write failed");
  }
}

ScopedTempFile::ScopedTempFile(ScopedTempFile&& other) noexcept : _path(std::move(other._path)) {
  other._path.clear();
}

ScopedTempFile& ScopedTempFile::operator=(ScopedTempFile&& other) noexcept {
  if (this != &other) {
    cleanup();
    _path = std::move(other._path);
    other._path.clear();
  }
  return *this;
}

ScopedTempFile::~ScopedTempFile() { cleanup(); }

void ScopedTempFile::cleanup() noexcept {
  if (!_path.empty()) {
    std::error_code ec;
    std::filesystem::remove(_path, ec);
    _path.clear();
  }
}

}  // namespace fsroute::test
