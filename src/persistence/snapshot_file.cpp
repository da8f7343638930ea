#include "persistence/snapshot_file.hpp"
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <fstream>
#include <streambuf>
#include <vector>

namespace cfs::persistence {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

namespace {

using Digest = std::array<uint8_t, SnapshotFile::DIGEST_SIZE>;

// Incremental SHA-256 using OpenSSL EVP
class DigestContext {
public:
  DigestContext() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
      throw SnapshotError("Snapshot file: Failed to create digest context");
    }
    if (!EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr)) {
      EVP_MD_CTX_free(ctx_);
      throw SnapshotError("Snapshot file: Failed to initialize digest");
    }
  }

  ~DigestContext() {
    EVP_MD_CTX_free(ctx_);
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  void update(const void* data, std::size_t size) {
    if (!EVP_DigestUpdate(ctx_, data, size)) {
      throw SnapshotError("Snapshot file: Failed to update digest");
    }
  }

  Digest finish() {
    Digest result{};
    unsigned int length = 0;
    if (!EVP_DigestFinal_ex(ctx_, result.data(), &length) || length != result.size()) {
      throw SnapshotError("Snapshot file: Failed to finalize digest");
    }
    return result;
  }

private:
  EVP_MD_CTX* ctx_;
};

// Forwards writes to an output stream and feeds them to the digest
class DigestingStreambuf : public std::streambuf {
public:
  DigestingStreambuf(std::ostream& output, DigestContext& digest)
    : output_(output), digest_(digest) {}

  std::size_t bytes_written() const { return bytes_written_; }

protected:
  std::streamsize xsputn(const char* data, std::streamsize size) override {
    if (!output_.write(data, size)) {
      return 0;
    }
    digest_.update(data, static_cast<std::size_t>(size));
    bytes_written_ += static_cast<std::size_t>(size);
    return size;
  }

  int_type overflow(int_type ch) override {
    if (traits_type::eq_int_type(ch, traits_type::eof())) {
      return traits_type::not_eof(ch);
    }
    const char c = traits_type::to_char_type(ch);
    return xsputn(&c, 1) == 1 ? ch : traits_type::eof();
  }

private:
  std::ostream& output_;
  DigestContext& digest_;
  std::size_t bytes_written_ = 0;
};

constexpr std::size_t DIGEST_BLOCK_SIZE = 64 * 1024;

// Bytes between the read position and limit
uint64_t bytes_left(std::istream& input, std::streampos limit) {
  const auto current = input.tellg();
  if (current < 0 || limit < current) {
    return 0;
  }
  return static_cast<uint64_t>(limit - current);
}

} // namespace


//==============================================
// SERIALIZATION AND DESERIALIZATION
//==============================================

std::size_t SnapshotFile::write_snapshot(const Snapshot& snapshot, std::ostream& output) {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Snapshot file: Invalid output stream state";
    throw SnapshotIOError("Snapshot file: Invalid output stream");
  }

  BOOST_LOG_TRIVIAL(info) << "Snapshot file: Serializing snapshot of " << snapshot.size() << " tenants";

  // The body goes straight to output while the digest accumulates
  DigestContext digest;
  DigestingStreambuf digesting_buffer(output, digest);
  std::ostream body_stream(&digesting_buffer);
  write_body(snapshot, body_stream);

  const Digest body_digest = digest.finish();
  write_bytes(output, body_digest.data(), body_digest.size());
  output.flush();

  const std::size_t total_bytes = digesting_buffer.bytes_written() + body_digest.size();
  BOOST_LOG_TRIVIAL(info) << "Snapshot file: Serialization complete. Total bytes written: " << total_bytes;
  return total_bytes;
}

Snapshot SnapshotFile::read_snapshot(std::istream& input) {
  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "Snapshot file: Invalid input stream state";
    throw SnapshotIOError("Snapshot file: Invalid input stream");
  }

  const std::streampos start = input.tellg();
  if (start < 0) {
    throw SnapshotIOError("Snapshot file: Input stream is not seekable");
  }
  input.seekg(0, std::ios::end);
  const std::streampos end = input.tellg();
  input.seekg(start);
  const uint64_t total_size = bytes_left(input, end);
  BOOST_LOG_TRIVIAL(info) << "Snapshot file: Deserializing " << total_size << " bytes";

  // Smallest valid file: header with zero tenants plus digest
  const std::size_t minimum_size = MAGIC.size() + sizeof(uint32_t) + sizeof(uint64_t) + DIGEST_SIZE;
  if (total_size < minimum_size) {
    BOOST_LOG_TRIVIAL(error) << "Snapshot file: Input too short: " << total_size << " bytes";
    throw SnapshotFormatError("snapshot truncated");
  }

  std::array<char, 8> magic;
  read_bytes(input, magic.data(), magic.size());
  if (magic != MAGIC) {
    BOOST_LOG_TRIVIAL(error) << "Snapshot file: Bad magic";
    throw SnapshotFormatError("not a snapshot file");
  }

  // First pass: hash the body block by block and compare with the trailer
  const uint64_t body_size = total_size - DIGEST_SIZE;
  const std::streampos body_end = start + static_cast<std::streamoff>(body_size);
  input.seekg(start);

  DigestContext digest;
  std::vector<char> block(static_cast<std::size_t>(std::min<uint64_t>(body_size, DIGEST_BLOCK_SIZE)));
  for (uint64_t left = body_size; left > 0;) {
    const std::size_t length = static_cast<std::size_t>(std::min<uint64_t>(left, block.size()));
    read_bytes(input, block.data(), length);
    digest.update(block.data(), length);
    left -= length;
  }

  Digest stored{};
  read_bytes(input, stored.data(), stored.size());
  if (digest.finish() != stored) {
    BOOST_LOG_TRIVIAL(error) << "Snapshot file: Digest mismatch";
    throw SnapshotIntegrityError("snapshot digest mismatch");
  }

  // Second pass: parse the verified body
  input.seekg(start);
  Snapshot snapshot = read_body(input, body_end);
  input.seekg(end);

  BOOST_LOG_TRIVIAL(info) << "Snapshot file: Deserialization complete. " << snapshot.size() << " tenants, "
                          << SnapshotCodec::count_files(snapshot) << " files";
  return snapshot;
}


//==============================================
// FILE OPERATIONS
//==============================================

void SnapshotFile::save_snapshot_file(const Snapshot& snapshot, const std::filesystem::path& path) {
  BOOST_LOG_TRIVIAL(info) << "Snapshot file: Saving snapshot to: " << path.string();

  const std::filesystem::path tmp_path = path.string() + ".tmp";

  try {
    if (path.has_parent_path()) {
      std::filesystem::create_directories(path.parent_path());
    }

    {
      std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
      if (!file) {
        throw SnapshotIOError("Failed to create file: " + tmp_path.string());
      }
      write_snapshot(snapshot, file);
      file.close();
      if (!file) {
        throw SnapshotIOError("Failed to write file: " + tmp_path.string());
      }
    }

    // Replace the previous snapshot only once the new one is complete
    std::filesystem::rename(tmp_path, path);
  }
  catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Snapshot file: Filesystem error while saving: " << e.what();
    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);
    throw SnapshotIOError(e.what());
  }
  catch (const SnapshotError&) {
    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);
    throw;
  }

  BOOST_LOG_TRIVIAL(info) << "Snapshot file: Saved snapshot to: " << path.string();
}

std::optional<Snapshot> SnapshotFile::load_snapshot_file(const std::filesystem::path& path) {
  BOOST_LOG_TRIVIAL(info) << "Snapshot file: Loading snapshot from: " << path.string();

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    BOOST_LOG_TRIVIAL(info) << "Snapshot file: No snapshot at: " << path.string();
    return std::nullopt;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Snapshot file: Failed to open: " << path.string();
    throw SnapshotIOError("Failed to open file: " + path.string());
  }

  return read_snapshot(file);
}


//==============================================
// BODY ENCODING
//==============================================

void SnapshotFile::write_body(const Snapshot& snapshot, std::ostream& output) {
  write_bytes(output, MAGIC.data(), MAGIC.size());
  write_u32(output, VERSION);
  write_u64(output, snapshot.size());

  for (const auto& entry : snapshot) {
    write_string(output, entry.tenant);
    write_u64(output, entry.files.size());

    for (const auto& [name, file] : entry.files) {
      write_string(output, name);
      write_string(output, file.file_type);
      write_u64(output, file.total_size);
      write_u64(output, file.chunks.size());

      for (const auto& chunk : file.chunks) {
        write_u64(output, chunk.index);
        write_u64(output, chunk.payload.size());
        if (!chunk.payload.empty()) {
          write_bytes(output, chunk.payload.data(), chunk.payload.size());
        }
      }
    }
  }
}

Snapshot SnapshotFile::read_body(std::istream& input, std::streampos body_end) {
  std::array<char, 8> magic;
  read_bytes(input, magic.data(), magic.size());
  if (magic != MAGIC) {
    throw SnapshotFormatError("not a snapshot file");
  }

  const uint32_t version = read_u32(input);
  if (version != VERSION) {
    BOOST_LOG_TRIVIAL(error) << "Snapshot file: Unsupported version: " << version;
    throw SnapshotFormatError("unsupported version " + std::to_string(version));
  }

  Snapshot snapshot;
  const uint64_t tenant_count = read_u64(input);
  BOOST_LOG_TRIVIAL(debug) << "Snapshot file: Reading " << tenant_count << " tenants";

  for (uint64_t t = 0; t < tenant_count; ++t) {
    TenantSnapshot entry;
    entry.tenant = read_string(input, body_end);

    const uint64_t file_count = read_u64(input);
    for (uint64_t f = 0; f < file_count; ++f) {
      store::ChunkedFile file;
      file.name = read_string(input, body_end);
      file.file_type = read_string(input, body_end);
      file.total_size = read_u64(input);

      const uint64_t chunk_count = read_u64(input);
      for (uint64_t c = 0; c < chunk_count; ++c) {
        store::Chunk chunk;
        chunk.index = read_u64(input);

        const uint64_t payload_size = read_u64(input);
        if (payload_size > bytes_left(input, body_end)) {
          throw SnapshotFormatError("chunk payload exceeds snapshot size");
        }
        chunk.payload.resize(payload_size);
        if (payload_size > 0) {
          read_bytes(input, chunk.payload.data(), payload_size);
        }
        file.chunks.push_back(std::move(chunk));
      }

      std::string name = file.name;
      entry.files.emplace_back(std::move(name), std::move(file));
    }

    snapshot.push_back(std::move(entry));
  }

  if (input.tellg() != body_end) {
    BOOST_LOG_TRIVIAL(error) << "Snapshot file: Trailing bytes after last tenant";
    throw SnapshotFormatError("trailing bytes after snapshot body");
  }

  return snapshot;
}


//==============================================
// STREAM OPERATIONS
//==============================================

void SnapshotFile::write_bytes(std::ostream& output, const void* data, std::size_t size) {
  if (!output.write(static_cast<const char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Snapshot file: Failed to write " << size << " bytes to output stream";
    throw SnapshotIOError("Snapshot file: Failed to write to output stream");
  }
}

void SnapshotFile::read_bytes(std::istream& input, void* data, std::size_t size) {
  if (!input.read(static_cast<char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Snapshot file: Failed to read " << size << " bytes from input stream";
    throw SnapshotFormatError("snapshot truncated");
  }
}

void SnapshotFile::write_u32(std::ostream& output, uint32_t value) {
  const uint32_t network_value = boost::endian::native_to_big(value);
  write_bytes(output, &network_value, sizeof(network_value));
}

void SnapshotFile::write_u64(std::ostream& output, uint64_t value) {
  const uint64_t network_value = boost::endian::native_to_big(value);
  write_bytes(output, &network_value, sizeof(network_value));
}

uint32_t SnapshotFile::read_u32(std::istream& input) {
  uint32_t network_value;
  read_bytes(input, &network_value, sizeof(network_value));
  return boost::endian::big_to_native(network_value);
}

uint64_t SnapshotFile::read_u64(std::istream& input) {
  uint64_t network_value;
  read_bytes(input, &network_value, sizeof(network_value));
  return boost::endian::big_to_native(network_value);
}

void SnapshotFile::write_string(std::ostream& output, const std::string& value) {
  if (value.size() > MAX_STRING_LENGTH) {
    throw SnapshotFormatError("string of " + std::to_string(value.size()) + " bytes exceeds limit");
  }
  write_u32(output, static_cast<uint32_t>(value.size()));
  if (!value.empty()) {
    write_bytes(output, value.data(), value.size());
  }
}

std::string SnapshotFile::read_string(std::istream& input, std::streampos body_end) {
  const uint32_t length = read_u32(input);
  if (length > MAX_STRING_LENGTH || length > bytes_left(input, body_end)) {
    BOOST_LOG_TRIVIAL(error) << "Snapshot file: String length " << length << " exceeds limit";
    throw SnapshotFormatError("string length exceeds limit");
  }

  std::string value(length, '\0');
  if (length > 0) {
    read_bytes(input, value.data(), length);
  }
  return value;
}

} // namespace cfs::persistence
