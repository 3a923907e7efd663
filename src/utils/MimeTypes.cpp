#include "utils/MimeTypes.h"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace MimeTypes {

std::string guess(const std::filesystem::path& path) {
    static const std::unordered_map<std::string, std::string> table = {
        // text
        {".txt", "text/plain"}, {".log", "text/plain"}, {".md", "text/markdown"},
        {".csv", "text/csv"}, {".tsv", "text/tab-separated-values"},
        {".html", "text/html"}, {".htm", "text/html"}, {".css", "text/css"},
        {".xml", "application/xml"}, {".json", "application/json"},
        {".yaml", "application/yaml"}, {".yml", "application/yaml"}, {".toml", "application/toml"},
        {".ini", "text/plain"}, {".cfg", "text/plain"}, {".conf", "text/plain"},
        // source code
        {".c", "text/x-c"}, {".h", "text/x-c"}, {".cpp", "text/x-c++"}, {".cc", "text/x-c++"},
        {".cxx", "text/x-c++"}, {".hpp", "text/x-c++"}, {".hh", "text/x-c++"},
        {".rs", "text/x-rust"}, {".go", "text/x-go"}, {".py", "text/x-python"},
        {".java", "text/x-java"}, {".kt", "text/x-kotlin"}, {".swift", "text/x-swift"},
        {".rb", "text/x-ruby"}, {".php", "application/x-httpd-php"},
        {".js", "text/javascript"}, {".mjs", "text/javascript"}, {".ts", "text/x-typescript"},
        {".sh", "application/x-sh"}, {".cmake", "text/x-cmake"},
        // images
        {".png", "image/png"}, {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"},
        {".gif", "image/gif"}, {".bmp", "image/bmp"}, {".webp", "image/webp"},
        {".svg", "image/svg+xml"}, {".ico", "image/x-icon"}, {".tif", "image/tiff"}, {".tiff", "image/tiff"},
        // audio / video
        {".mp3", "audio/mpeg"}, {".wav", "audio/wav"}, {".ogg", "audio/ogg"}, {".flac", "audio/flac"},
        {".mp4", "video/mp4"}, {".webm", "video/webm"}, {".mkv", "video/x-matroska"}, {".mov", "video/quicktime"},
        // archives
        {".zip", "application/zip"}, {".gz", "application/gzip"}, {".tar", "application/x-tar"},
        {".bz2", "application/x-bzip2"}, {".xz", "application/x-xz"}, {".7z", "application/x-7z-compressed"},
        // documents
        {".pdf", "application/pdf"}, {".doc", "application/msword"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".xls", "application/vnd.ms-excel"},
        {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {".wasm", "application/wasm"}
    };

    std::string ext = path.extension().u8string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = table.find(ext);
    if (it == table.end()) {
        return "application/octet-stream";
    }
    return it->second;
}

}
