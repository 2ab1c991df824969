#include "asesweep/io/RunInfo.hpp"

#include <openssl/evp.h>
#include <sys/utsname.h>
#include <zlib.h>

#include <array>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <random>
#include <sstream>
#include <vector>

namespace asesweep::info {

namespace {

std::string format_tm(const std::tm& tm, const char* fmt) {
    std::ostringstream os;
    os << std::put_time(&tm, fmt);
    return os.str();
}

std::string to_hex(const unsigned char* p, std::size_t n) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string s(n * 2, '0');
    for (std::size_t i = 0; i < n; ++i) {
        s[2 * i]     = kDigits[p[i] >> 4];
        s[2 * i + 1] = kDigits[p[i] & 0x0f];
    }
    return s;
}

struct MdCtxFree {
    void operator()(EVP_MD_CTX* c) const noexcept { EVP_MD_CTX_free(c); }
};

} // namespace

std::string iso_utc_now()
{
    const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&t, &tm);
    return format_tm(tm, "%Y-%m-%dT%H:%M:%SZ");
}

std::string local_stamp(const char* fmt, std::chrono::system_clock::time_point tp)
{
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    return format_tm(tm, fmt);
}

std::string rand_id()
{
    std::random_device rd;
    std::array<unsigned char, 16> bytes{};
    for (auto& b : bytes) b = static_cast<unsigned char>(rd() & 0xff);
    return to_hex(bytes.data(), bytes.size());
}

std::uint32_t crc32_bytes(const void* data, std::size_t size)
{
    uLong crc = ::crc32(0L, Z_NULL, 0);
    crc = ::crc32(crc, static_cast<const Bytef*>(data), static_cast<uInt>(size));
    return static_cast<std::uint32_t>(crc);
}

Artifact describe_artifact(const std::filesystem::path& root,
                           const std::filesystem::path& p,
                           const std::string& kind)
{
    Artifact a;
    a.path = std::filesystem::relative(p, root).generic_string();
    a.kind = kind;

    std::ifstream f(p, std::ios::binary);
    std::unique_ptr<EVP_MD_CTX, MdCtxFree> ctx(EVP_MD_CTX_new());
    if (!f || !ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) return a;

    std::vector<char> buf(1 << 16);
    uLong crc = ::crc32(0L, Z_NULL, 0);
    std::uintmax_t total = 0;
    while (f.read(buf.data(), static_cast<std::streamsize>(buf.size())) || f.gcount() > 0) {
        const auto got = static_cast<std::size_t>(f.gcount());
        if (EVP_DigestUpdate(ctx.get(), buf.data(), got) != 1) return a;
        crc = ::crc32(crc, reinterpret_cast<const Bytef*>(buf.data()), static_cast<uInt>(got));
        total += got;
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md, &mdLen) != 1) return a;

    std::ostringstream c;
    c << std::hex << std::uppercase << std::setfill('0') << std::setw(8) << crc;
    a.size = total;
    a.sha256 = to_hex(md, mdLen);
    a.crc32 = c.str();
    return a;
}

std::string join_argv(int argc, char** argv)
{
    std::string s;
    for (int i = 0; i < argc; ++i) {
        if (i) s += ' ';
        s += argv[i];
    }
    return s;
}

std::string os_name()
{
    utsname u{};
    if (::uname(&u) != 0) return "unknown";
    return std::string(u.sysname) + " " + u.release;
}

} // namespace asesweep::info
