#include "io/AtomicFile.h"

#include <fstream>
#include <system_error>
#include <utility>

namespace {

bool write_temp_and_flush(const std::filesystem::path& temp, std::string_view bytes, std::string* err)
{
    std::ofstream f(temp, std::ios::binary | std::ios::trunc);
    if (!f) {
        if (err) *err = "cannot open " + temp.string() + " for writing";
        return false;
    }
    f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    f.flush();
    if (!f) {
        if (err) *err = "write failed for " + temp.string();
        return false;
    }
    return true;
}

} // namespace

namespace maze::io {

bool write_atomic(const fs::path& path, std::string_view bytes, std::string* err)
{
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            if (err) *err = "create_directories failed for " + path.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    auto tmp = path; tmp += ".tmp";

    if (!write_temp_and_flush(tmp, bytes, err)) {
        fs::remove(tmp, ec);
        return false;
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        if (err) *err = "rename to " + path.string() + " failed: " + ec.message();
        std::error_code rec;
        fs::remove(tmp, rec);
        return false;
    }
    return true;
}

bool read_all(const fs::path& p, std::string& out, std::string* err)
{
    std::ifstream in(p, std::ios::binary);
    if (!in) { if (err) *err = "open failed: " + p.string(); return false; }
    in.seekg(0, std::ios::end);
    const auto sz = in.tellg();
    if (sz < 0) { if (err) *err = "tellg failed: " + p.string(); return false; }
    in.seekg(0, std::ios::beg);
    std::string buf(static_cast<size_t>(sz), '\0');
    if (sz > 0) in.read(buf.data(), sz);
    if (!in) { if (err) *err = "read failed: " + p.string(); return false; }
    out = std::move(buf);
    return true;
}

} // namespace maze::io
