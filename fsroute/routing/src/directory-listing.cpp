#include "fsroute/directory-listing.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <format>
#include <iterator>
#include <limits>
#include <string>
#include <string_view>

#include "fsroute/route-node.hpp"
#include "fsroute/timedef.hpp"
#include "fsroute/timestring.hpp"
#include "fsroute/url-encode.hpp"
#include "fsroute/vector.hpp"

namespace fsroute {

namespace {

constexpr auto kUnreservedTable = []() constexpr {
  std::array<bool, std::numeric_limits<unsigned char>::max() + 1> table{};

  std::ranges::fill(table.begin() + 'A', table.begin() + 'Z' + 1, true);
  std::ranges::fill(table.begin() + 'a', table.begin() + 'z' + 1, true);
  std::ranges::fill(table.begin() + '0', table.begin() + '9' + 1, true);

  table[static_cast<unsigned char>('-')] = true;
  table[static_cast<unsigned char>('_')] = true;
  table[static_cast<unsigned char>('.')] = true;
  table[static_cast<unsigned char>('~')] = true;

  return table;
}();

constexpr bool IsUnreserved(char ch) noexcept { return kUnreservedTable[static_cast<unsigned char>(ch)]; }

void AppendHtmlEscaped(std::string_view str, std::string& out) {
  for (char ch : str) {
    switch (ch) {
      case '&':
        out.append("&amp;");
        break;
      case '<':
        out.append("&lt;");
        break;
      case '>':
        out.append("&gt;");
        break;
      case '"':
        out.append("&quot;");
        break;
      case '\'':
        out.append("&#39;");
        break;
      default:
        out.push_back(ch);
        break;
    }
  }
}

// "/" followed by each segment URL-encoded, with a trailing slash for non root directories.
void AppendEncodedDirectoryHref(std::string_view normalizedPath, std::string& out) {
  out.push_back('/');
  while (!normalizedPath.empty()) {
    const auto slashPos = normalizedPath.find('/');
    URLEncodeAppend(normalizedPath.substr(0, slashPos), IsUnreserved, out);
    out.push_back('/');
    if (slashPos == std::string_view::npos) {
      break;
    }
    normalizedPath.remove_prefix(slashPos + 1);
  }
}

void AppendLastModified(SysTimePoint tp, std::string& out) {
  if (tp == kInvalidTimePoint) {
    out.push_back('-');
  } else {
    std::array<char, kRFC7231DateStrLen> buf;
    TimeToStringRFC7231(tp, buf.data());
    out.append(buf.data(), buf.size());
  }
}

void AppendCss(std::string_view customCss, std::string& out) {
  if (!customCss.empty()) {
    out.append(customCss);
  } else {
    out.append(R"CSS(
body{font-family:system-ui,-apple-system,BlinkMacSystemFont,"Segoe UI",sans-serif;margin:2rem;}
table{border-collapse:collapse;width:100%;max-width:960px;}
th,td{padding:0.3rem 0.6rem;text-align:left;border-bottom:1px solid #e0e0e0;}
tbody tr:hover{background:#f8f8f8;}
td.size,td.modified{text-align:right;font-variant-numeric:tabular-nums;}
h1{font-size:1.4rem;margin-bottom:1rem;}
#truncated{margin-top:1rem;color:#b24e00;}
footer{margin-top:2rem;font-size:0.85rem;color:#666;}
a.dir::after{content:"/";}
)CSS");
  }
}

}  // namespace

void AppendFormattedSize(std::uint64_t size, std::string& out) {
  static constexpr std::array<std::string_view, 5> kUnits{"B", "KB", "MB", "GB", "TB"};

  std::size_t unitIdx = 0;
  std::uint64_t divisor = 1;
  for (; unitIdx + 1U < kUnits.size() && size >= divisor * 1024U; ++unitIdx) {
    divisor *= 1024U;
  }

  if (unitIdx == 0U) {
    std::format_to(std::back_inserter(out), "{} {}", size, kUnits[unitIdx]);
    return;
  }

  // one decimal below 10, rounded integer above
  if (size < divisor * 10U) {
    std::uint64_t intPart = size / divisor;
    std::uint64_t frac10 = ((size % divisor) * 10U + divisor / 2U) / divisor;
    if (frac10 >= 10U) {
      ++intPart;
      frac10 = 0U;
    }
    if (intPart >= 10U) {
      std::format_to(std::back_inserter(out), "{} {}", intPart, kUnits[unitIdx]);
    } else {
      std::format_to(std::back_inserter(out), "{}.{} {}", intPart, frac10, kUnits[unitIdx]);
    }
    return;
  }

  std::format_to(std::back_inserter(out), "{} {}", (size + divisor / 2U) / divisor, kUnits[unitIdx]);
}

DirectoryListing RenderDirectoryListing(const RouteNode& directory, const RouteConfig& config) {
  DirectoryListing listing;

  vector<const RouteNode*> entries;
  entries.reserve(directory.children.size());
  for (const auto& [segment, child] : directory.children) {
    if (!child->forbidden) {
      entries.push_back(child.get());
    }
  }
  // children are already sorted by name: a stable partition puts directories first
  std::ranges::stable_partition(entries, [](const RouteNode* node) { return node->descriptor.isDirectory(); });

  if (config.maxEntriesToList != 0 && entries.size() > config.maxEntriesToList) {
    entries.resize(config.maxEntriesToList);
    listing.truncated = true;
  }
  listing.nbEntries = entries.size();

  const std::string_view dirPath = directory.descriptor.normalizedPath;
  std::string displayPath("/");
  displayPath.append(dirPath);
  if (!dirPath.empty()) {
    displayPath.push_back('/');
  }

  std::string& body = listing.html;
  body.reserve(2048U + (entries.size() * 160U));

  body.append("<!doctype html>\n<html lang=\"en\">\n<head>\n<meta charset=\"utf-8\">\n<title>Index of ");
  AppendHtmlEscaped(displayPath, body);
  body.append("</title>\n<style>");
  AppendCss(config.directoryListingCss, body);
  body.append("</style>\n</head>\n<body>\n<h1>Index of ");
  AppendHtmlEscaped(displayPath, body);
  body.append(
      "</h1>\n<table>\n<thead><tr><th>Name</th><th class=\"size\">Size</th><th class=\"modified\">Last "
      "Modified</th></tr></thead>\n<tbody>\n");

  std::string dirHref;
  AppendEncodedDirectoryHref(dirPath, dirHref);

  if (!dirPath.empty()) {
    const auto parentEnd = dirPath.rfind('/');
    std::string parentHref;
    AppendEncodedDirectoryHref(parentEnd == std::string_view::npos ? std::string_view() : dirPath.substr(0, parentEnd),
                               parentHref);
    body.append(R"(<tr><td class="name"><a href=")");
    body.append(parentHref);
    body.append(
        "\" class=\"dir\">..</a></td><td class=\"size\">-</td><td "
        "class=\"modified\">-</td></tr>\n");
  }

  for (const RouteNode* entry : entries) {
    const RouteDescriptor& descriptor = entry->descriptor;
    const bool isDir = descriptor.isDirectory();
    std::string_view name = descriptor.normalizedPath;
    name.remove_prefix(name.rfind('/') + 1U);

    body.append(R"(<tr><td class="name"><a href=")");
    body.append(dirHref);
    URLEncodeAppend(name, IsUnreserved, body);
    if (isDir) {
      body.push_back('/');
    }
    body.push_back('"');
    if (isDir) {
      body.append(" class=\"dir\"");
    }
    body.push_back('>');
    AppendHtmlEscaped(name, body);

    body.append("</a></td><td class=\"size\">");
    if (isDir) {
      body.push_back('-');
    } else {
      AppendFormattedSize(descriptor.fileSize, body);
    }
    body.append("</td><td class=\"modified\">");
    AppendLastModified(descriptor.lastModified, body);
    body.append("</td></tr>\n");
  }

  body.append("</tbody>\n</table>\n");
  if (listing.truncated) {
    std::format_to(std::back_inserter(body), "<p id=\"truncated\">Listing truncated after {} entries.</p>\n",
                   entries.size());
  }
  body.append("<footer>Served by fsroute</footer>\n</body>\n</html>\n");
  return listing;
}

}  // namespace fsroute
