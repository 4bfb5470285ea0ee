#include "csv_toolbox/chunk_source.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>

namespace ctb {

bool StringChunkSource::next(std::string& out) {
  if (pos_ >= chunks_.size()) return false;
  out = chunks_[pos_++];
  return true;
}

struct FileChunkSource::Impl {
  std::string path;
  Config cfg;
  FILE* f{nullptr};
  bool opened{false};
  bool eof{false};
  int last_errno{0};
  std::uint64_t bytes{0};
  std::vector<char> buf;
  Error err;

  bool fail_io(const char* what) {
    last_errno = errno;
    err = make_error(ErrorCode::Io, std::string(what) + " '" + path + "': " + std::strerror(last_errno));
    close();
    return false;
  }

  void close() {
    if (f) { std::fclose(f); f = nullptr; }
  }

  bool next(std::string& out) {
    if (eof || !err.ok()) return false;
    if (!opened) {
      opened = true;
      f = std::fopen(path.c_str(), "rb");
      if (!f) return fail_io("cannot open");
      buf.assign(cfg.chunk_bytes ? cfg.chunk_bytes : 1, 0);
    }
    std::size_t n = std::fread(buf.data(), 1, buf.size(), f);
    if (n == 0) {
      if (std::ferror(f)) return fail_io("read failed on");
      eof = true;
      close();
      return false;
    }
    bytes += n;
    out.assign(buf.data(), n);
    return true;
  }
};

FileChunkSource::FileChunkSource(std::string path) : FileChunkSource(std::move(path), Config{}) {}

FileChunkSource::FileChunkSource(std::string path, Config cfg) : p_(new Impl{}) {
  p_->path = std::move(path);
  p_->cfg = cfg;
}

FileChunkSource::~FileChunkSource() {
  p_->close();
  delete p_;
}

bool FileChunkSource::next(std::string& out) { return p_->next(out); }
const Error& FileChunkSource::error() const { return p_->err; }
int FileChunkSource::last_error() const noexcept { return p_->last_errno; }
std::uint64_t FileChunkSource::bytes_read() const noexcept { return p_->bytes; }

bool RewindableSource::next(std::string& out) {
  std::lock_guard<std::mutex> lk(mu_);
  if (cursor_ < recorded_.size()) {
    out = recorded_[cursor_++];
    if (committed_ && cursor_ == recorded_.size()) {
      recorded_.clear();
      cursor_ = 0;
    }
    return true;
  }
  if (!inner_->next(out)) return false;
  if (!committed_) {
    recorded_.push_back(out);
    ++cursor_;
  }
  return true;
}

bool RewindableSource::rewind() {
  std::lock_guard<std::mutex> lk(mu_);
  if (committed_) return false;
  cursor_ = 0;
  return true;
}

void RewindableSource::commit() {
  std::lock_guard<std::mutex> lk(mu_);
  if (committed_) return;
  committed_ = true;
  // Chunks not yet replayed still have to be handed out once.
  recorded_.erase(recorded_.begin(), recorded_.begin() + static_cast<std::ptrdiff_t>(cursor_));
  cursor_ = 0;
}

bool RewindableSource::committed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return committed_;
}

std::size_t RewindableSource::buffered() const {
  std::lock_guard<std::mutex> lk(mu_);
  return recorded_.size() - cursor_;
}

}
