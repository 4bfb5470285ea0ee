#pragma once
#include "csv_toolbox/error.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ctb {

// Pull-based producer of raw chunks (bytes or UTF-8 text, depending on the input shape).
class ChunkSource {
public:
  virtual ~ChunkSource() = default;
  // Replaces `out` with the next chunk. False at end of input or on failure.
  virtual bool next(std::string& out) = 0;
  // Set when next() returned false because of a failure.
  virtual const Error& error() const = 0;
};

class StringChunkSource : public ChunkSource {
public:
  explicit StringChunkSource(std::vector<std::string> chunks) : chunks_(std::move(chunks)) {}

  bool next(std::string& out) override;
  const Error& error() const override { return err_; }

private:
  std::vector<std::string> chunks_;
  std::size_t pos_ = 0;
  Error err_;
};

// Fixed-size binary reads; no line handling, the lexer owns that.
class FileChunkSource : public ChunkSource {
public:
  struct Config {
    std::size_t chunk_bytes = 512 * 1024; // 512 KiB
  };

  explicit FileChunkSource(std::string path);      // uses default Config{}
  FileChunkSource(std::string path, Config cfg);   // explicit Config
  ~FileChunkSource() override;
  FileChunkSource(const FileChunkSource&) = delete;
  FileChunkSource& operator=(const FileChunkSource&) = delete;

  bool next(std::string& out) override;
  const Error& error() const override;
  int  last_error() const noexcept;
  std::uint64_t bytes_read() const noexcept;

private:
  struct Impl; Impl* p_;
};

// Records chunks until commit() so a failed attempt can be replayed from the
// start. Safe to commit() from another thread than the one calling next().
class RewindableSource : public ChunkSource {
public:
  explicit RewindableSource(std::shared_ptr<ChunkSource> inner) : inner_(std::move(inner)) {}

  bool next(std::string& out) override;
  const Error& error() const override { return inner_->error(); }

  // False once committed.
  bool rewind();
  void commit();
  bool committed() const;
  // Chunks held for replay.
  std::size_t buffered() const;

private:
  mutable std::mutex mu_;
  std::shared_ptr<ChunkSource> inner_;
  std::vector<std::string> recorded_;
  std::size_t cursor_ = 0;
  bool committed_ = false;
};

}
