#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <string>
#include <vector>
#include "service/file_service.hpp"

namespace cfs {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(service::FileService& file_service, const std::filesystem::path& snapshot_path,
        const store::TenantId& tenant, std::istream& in = std::cin, std::ostream& out = std::cout);


    // ---- STARTUP ----
    void run();
    // Checked after each input line; the loop ends once it returns true
    void set_stop_predicate(std::function<bool()> stop_predicate) { stop_predicate_ = std::move(stop_predicate); }

    const store::TenantId& current_tenant() const { return tenant_; }

    // Chunk size used by "put"
    static constexpr std::size_t DEFAULT_CHUNK_SIZE = 1024 * 1024;

private:
    // ---- PARAMETERS ----
    bool running_;
    store::TenantId tenant_;
    std::filesystem::path snapshot_path_;
    std::function<bool()> stop_predicate_;
    // System components
    service::FileService& file_service_;
    std::istream& in_;
    std::ostream& out_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::vector<std::string>& args);
    void handle_tenant_command(const std::vector<std::string>& args);
    void handle_list_command();
    void handle_exists_command(const std::vector<std::string>& args);
    void handle_upload_command(const std::vector<std::string>& args);
    void handle_put_command(const std::vector<std::string>& args);
    void handle_chunks_command(const std::vector<std::string>& args);
    void handle_get_command(const std::vector<std::string>& args);
    void handle_fetch_command(const std::vector<std::string>& args);
    void handle_type_command(const std::vector<std::string>& args);
    void handle_delete_command(const std::vector<std::string>& args);
    void handle_save_command();
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);


    // ---- LOCAL FILE ACCESS ----
    static std::vector<uint8_t> read_local_file(const std::string& path);
    static void write_local_file(const std::string& path, const std::vector<uint8_t>& data);
    static uint64_t parse_index(const std::string& text);
};

} // namespace cli
} // namespace cfs
