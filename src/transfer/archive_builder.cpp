/**
 * @file archive_builder.cpp
 * @brief ustar writer, libzip writer and libzip extractor
 */

#include <xnat/transfer/archive_builder.hpp>

#include <zip.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstring>
#include <fstream>
#include <memory>
#include <system_error>

namespace fs = std::filesystem;

namespace xnat::transfer {

namespace {

constexpr std::size_t tar_block = 512;
constexpr std::size_t copy_buffer_size = 64 * 1024;

auto entry_name(const fs::path& file, const fs::path& base_dir) -> std::string {
    auto relative = file.lexically_relative(base_dir);
    if (relative.empty() || *relative.begin() == "..") {
        relative = file.filename();
    }
    return relative.generic_string();
}

auto zip_error_text(int code) -> std::string {
    zip_error_t error;
    zip_error_init_with_code(&error, code);
    std::string text = zip_error_strerror(&error);
    zip_error_fini(&error);
    return text;
}

void remove_quietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

// =============================================================================
// ustar
// =============================================================================

/**
 * @brief Minimal POSIX ustar writer for regular files
 *
 * Names longer than 100 bytes are split into prefix/name; names that
 * cannot be split use a GNU ././@LongLink record. Sizes beyond the octal
 * field use the base-256 extension.
 */
class tar_writer {
public:
    explicit tar_writer(const fs::path& destination)
        : out_(destination, std::ios::binary | std::ios::trunc) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    auto add_file(const fs::path& source, const std::string& name) -> VoidResult {
        std::error_code ec;
        const auto size = fs::file_size(source, ec);
        if (ec) {
            return xnat_void_error(error_codes::file_io_error, "Cannot stat file",
                                   source.string() + ": " + ec.message());
        }
        const auto mtime = file_mtime(source);

        std::ifstream in(source, std::ios::binary);
        if (!in) {
            return xnat_void_error(error_codes::file_io_error, "Cannot open file",
                                   source.string());
        }

        std::string short_name;
        std::string prefix;
        if (!split_name(name, prefix, short_name)) {
            write_long_name(name);
            short_name = name.substr(0, 99);
            prefix.clear();
        }
        write_header(short_name, prefix, size, mtime, '0');

        std::array<char, copy_buffer_size> buffer{};
        std::uint64_t copied = 0;
        while (in && copied < size) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto got = in.gcount();
            if (got <= 0) {
                break;
            }
            out_.write(buffer.data(), got);
            copied += static_cast<std::uint64_t>(got);
        }
        if (copied != size) {
            return xnat_void_error(error_codes::file_io_error,
                                   "File changed size while archiving", source.string());
        }
        pad(size);

        if (!out_) {
            return xnat_void_error(error_codes::archive_error, "Failed writing tar archive");
        }
        return ok();
    }

    auto finish() -> VoidResult {
        static const std::array<char, tar_block * 2> trailer{};
        out_.write(trailer.data(), static_cast<std::streamsize>(trailer.size()));
        out_.close();
        if (!out_) {
            return xnat_void_error(error_codes::archive_error, "Failed finalising tar archive");
        }
        return ok();
    }

private:
    std::ofstream out_;

    static auto file_mtime(const fs::path& source) -> std::uint64_t {
        std::error_code ec;
        auto ftime = fs::last_write_time(source, ec);
        if (ec) {
            return 0;
        }
        auto sys = std::chrono::time_point_cast<std::chrono::seconds>(
            ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
        auto seconds = sys.time_since_epoch().count();
        return seconds > 0 ? static_cast<std::uint64_t>(seconds) : 0;
    }

    static bool split_name(const std::string& name, std::string& prefix, std::string& rest) {
        if (name.size() <= 100) {
            prefix.clear();
            rest = name;
            return true;
        }
        for (auto slash = name.find('/'); slash != std::string::npos;
             slash = name.find('/', slash + 1)) {
            if (slash <= 155 && name.size() - slash - 1 <= 100 && slash + 1 < name.size()) {
                prefix = name.substr(0, slash);
                rest = name.substr(slash + 1);
                return true;
            }
        }
        return false;
    }

    static void put_octal(char* field, std::size_t width, std::uint64_t value) {
        // width includes the terminating NUL
        std::memset(field, '0', width - 1);
        field[width - 1] = '\0';
        for (std::size_t i = width - 1; i > 0 && value > 0; --i) {
            field[i - 1] = static_cast<char>('0' + (value & 7));
            value >>= 3;
        }
    }

    static void put_size(char* field, std::uint64_t size) {
        constexpr std::uint64_t octal_limit = 077777777777ULL;
        if (size <= octal_limit) {
            put_octal(field, 12, size);
            return;
        }
        std::memset(field, 0, 12);
        field[0] = static_cast<char>(0x80);
        for (int i = 11; i > 3; --i) {
            field[i] = static_cast<char>(size & 0xFF);
            size >>= 8;
        }
    }

    void write_header(const std::string& name, const std::string& prefix,
                      std::uint64_t size, std::uint64_t mtime, char type) {
        std::array<char, tar_block> header{};
        std::memcpy(header.data(), name.data(), std::min<std::size_t>(name.size(), 100));
        put_octal(header.data() + 100, 8, 0644);
        put_octal(header.data() + 108, 8, 0);
        put_octal(header.data() + 116, 8, 0);
        put_size(header.data() + 124, size);
        put_octal(header.data() + 136, 12, mtime);
        header[156] = type;
        std::memcpy(header.data() + 257, "ustar", 6);
        std::memcpy(header.data() + 263, "00", 2);
        std::memcpy(header.data() + 345, prefix.data(), std::min<std::size_t>(prefix.size(), 155));

        // Checksum is computed with the field filled with spaces
        std::memset(header.data() + 148, ' ', 8);
        unsigned int sum = 0;
        for (char c : header) {
            sum += static_cast<unsigned char>(c);
        }
        put_octal(header.data() + 148, 7, sum);
        header[155] = ' ';

        out_.write(header.data(), static_cast<std::streamsize>(header.size()));
    }

    void write_long_name(const std::string& name) {
        const std::string payload = name + '\0';
        write_header("././@LongLink", "", payload.size(), 0, 'L');
        out_.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        pad(payload.size());
    }

    void pad(std::uint64_t written) {
        static const std::array<char, tar_block> zeros{};
        const auto remainder = written % tar_block;
        if (remainder != 0) {
            out_.write(zeros.data(), static_cast<std::streamsize>(tar_block - remainder));
        }
    }
};

auto build_tar(const std::vector<fs::path>& files, const fs::path& base_dir,
               const fs::path& destination) -> VoidResult {
    tar_writer writer(destination);
    if (!writer.is_open()) {
        return xnat_void_error(error_codes::file_io_error, "Cannot create archive",
                               destination.string());
    }
    for (const auto& file : files) {
        auto added = writer.add_file(file, entry_name(file, base_dir));
        if (added.is_err()) {
            return added;
        }
    }
    return writer.finish();
}

// =============================================================================
// zip
// =============================================================================

auto build_zip(const std::vector<fs::path>& files, const fs::path& base_dir,
               const fs::path& destination) -> VoidResult {
    int open_error = 0;
    zip_t* archive = zip_open(destination.string().c_str(), ZIP_CREATE | ZIP_TRUNCATE,
                              &open_error);
    if (archive == nullptr) {
        return xnat_void_error(error_codes::archive_error, "Cannot create zip archive",
                               destination.string() + ": " + zip_error_text(open_error));
    }

    for (const auto& file : files) {
        zip_source_t* source = zip_source_file(archive, file.string().c_str(), 0, -1);
        if (source == nullptr) {
            std::string reason = zip_strerror(archive);
            zip_discard(archive);
            return xnat_void_error(error_codes::file_io_error, "Cannot read file",
                                   file.string() + ": " + reason);
        }

        const auto name = entry_name(file, base_dir);
        const zip_int64_t index = zip_file_add(archive, name.c_str(), source,
                                               ZIP_FL_ENC_UTF_8 | ZIP_FL_OVERWRITE);
        if (index < 0) {
            std::string reason = zip_strerror(archive);
            zip_source_free(source);
            zip_discard(archive);
            return xnat_void_error(error_codes::archive_error, "Cannot add zip entry",
                                   name + ": " + reason);
        }
        if (zip_set_file_compression(archive, static_cast<zip_uint64_t>(index),
                                     ZIP_CM_DEFLATE, 0) != 0) {
            std::string reason = zip_strerror(archive);
            zip_discard(archive);
            return xnat_void_error(error_codes::archive_error,
                                   "Cannot set zip compression", name + ": " + reason);
        }
    }

    // Sources are read here, not when added
    if (zip_close(archive) != 0) {
        std::string reason = zip_strerror(archive);
        zip_discard(archive);
        return xnat_void_error(error_codes::archive_error, "Failed writing zip archive",
                               destination.string() + ": " + reason);
    }
    return ok();
}

struct zip_closer {
    void operator()(zip_t* archive) const {
        if (archive) zip_discard(archive);
    }
};
using zip_ptr = std::unique_ptr<zip_t, zip_closer>;

struct zip_file_closer {
    void operator()(zip_file_t* file) const {
        if (file) zip_fclose(file);
    }
};
using zip_file_ptr = std::unique_ptr<zip_file_t, zip_file_closer>;

auto open_for_reading(const fs::path& archive) -> Result<zip_ptr> {
    int open_error = 0;
    zip_t* handle = zip_open(archive.string().c_str(), ZIP_RDONLY, &open_error);
    if (handle == nullptr) {
        return xnat_error<zip_ptr>(error_codes::extraction_error, "Cannot open zip archive",
                                   archive.string() + ": " + zip_error_text(open_error));
    }
    return Result<zip_ptr>::ok(zip_ptr(handle));
}

/**
 * @brief True if @p relative stays below the extraction root
 */
bool is_contained(const fs::path& relative) {
    if (relative.empty() || relative.is_absolute() || relative.has_root_name()) {
        return false;
    }
    auto normal = relative.lexically_normal();
    return !normal.empty() && *normal.begin() != ".." && normal != ".";
}

}  // namespace

// =============================================================================
// Public API
// =============================================================================

auto build_archive(const std::vector<fs::path>& files, const fs::path& base_dir,
                   const fs::path& destination, archive_format format)
    -> Result<std::uint64_t> {
    if (files.empty()) {
        return xnat_error<std::uint64_t>(error_codes::archive_error,
                                         "Cannot build an empty archive");
    }

    std::error_code ec;
    if (destination.has_parent_path()) {
        fs::create_directories(destination.parent_path(), ec);
    }

    auto built = format == archive_format::zip ? build_zip(files, base_dir, destination)
                                               : build_tar(files, base_dir, destination);
    if (built.is_err()) {
        remove_quietly(destination);
        return forward_error<std::uint64_t>(built.error());
    }

    auto size = fs::file_size(destination, ec);
    if (ec) {
        return xnat_error<std::uint64_t>(error_codes::file_io_error,
                                         "Archive missing after write", destination.string());
    }
    return ok(static_cast<std::uint64_t>(size));
}

auto list_zip_entries(const fs::path& archive) -> Result<std::vector<std::string>> {
    auto opened = open_for_reading(archive);
    if (opened.is_err()) {
        return forward_error<std::vector<std::string>>(opened.error());
    }
    zip_t* handle = opened.value().get();

    std::vector<std::string> names;
    const zip_int64_t count = zip_get_num_entries(handle, 0);
    for (zip_int64_t i = 0; i < count; ++i) {
        const char* name = zip_get_name(handle, static_cast<zip_uint64_t>(i), 0);
        if (name != nullptr) {
            names.emplace_back(name);
        }
    }
    return ok(std::move(names));
}

auto extract_zip(const fs::path& archive, const fs::path& destination,
                 const entry_mapper& mapper) -> Result<extraction_result> {
    auto opened = open_for_reading(archive);
    if (opened.is_err()) {
        return forward_error<extraction_result>(opened.error());
    }
    zip_t* handle = opened.value().get();

    extraction_result result;
    std::array<char, copy_buffer_size> buffer{};

    const zip_int64_t count = zip_get_num_entries(handle, 0);
    for (zip_int64_t i = 0; i < count; ++i) {
        const auto index = static_cast<zip_uint64_t>(i);
        zip_stat_t stat;
        zip_stat_init(&stat);
        if (zip_stat_index(handle, index, 0, &stat) != 0 || stat.name == nullptr) {
            return xnat_error<extraction_result>(error_codes::extraction_error,
                                                 "Cannot read zip entry",
                                                 zip_strerror(handle));
        }

        const std::string name = stat.name;
        if (name.empty() || name.back() == '/') {
            continue;
        }

        std::optional<fs::path> relative = mapper ? mapper(name) : fs::path(name);
        if (!relative || !is_contained(*relative)) {
            ++result.skipped;
            continue;
        }

        const auto target = destination / relative->lexically_normal();
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return xnat_error<extraction_result>(error_codes::file_io_error,
                                                 "Cannot create directory",
                                                 target.parent_path().string());
        }

        zip_file_ptr entry(zip_fopen_index(handle, index, 0));
        if (!entry) {
            return xnat_error<extraction_result>(error_codes::extraction_error,
                                                 "Cannot open zip entry",
                                                 name + ": " + zip_strerror(handle));
        }

        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out) {
            return xnat_error<extraction_result>(error_codes::file_io_error,
                                                 "Cannot write file", target.string());
        }

        while (true) {
            const zip_int64_t got = zip_fread(entry.get(), buffer.data(), buffer.size());
            if (got < 0) {
                return xnat_error<extraction_result>(
                    error_codes::extraction_error, "Corrupt zip entry",
                    name + ": " + zip_error_strerror(zip_file_get_error(entry.get())));
            }
            if (got == 0) {
                break;
            }
            out.write(buffer.data(), static_cast<std::streamsize>(got));
        }
        out.close();
        if (!out) {
            return xnat_error<extraction_result>(error_codes::file_io_error,
                                                 "Failed writing file", target.string());
        }
        result.written.push_back(target);
    }

    return ok(std::move(result));
}

}  // namespace xnat::transfer
