#include "web_tools.hpp"
#include "../utils.hpp"
#include <httplib.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <vector>

namespace strata {

// ── HTML to Markdown ──

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string tag_name(const std::string& tag) {
    size_t i = (!tag.empty() && tag[0] == '/') ? 1 : 0;
    std::string name;
    while (i < tag.size() && std::isalnum(static_cast<unsigned char>(tag[i]))) {
        name += static_cast<char>(std::tolower(static_cast<unsigned char>(tag[i])));
        i++;
    }
    return name;
}

// Value of attr="..." (or '...' or bare) inside a tag body; "" when absent.
static std::string tag_attribute(const std::string& tag, const std::string& attr) {
    std::string lower = lowercase(tag);
    std::string key = attr + "=";
    for (size_t pos = lower.find(key); pos != std::string::npos; pos = lower.find(key, pos + 1)) {
        if (pos > 0 && !std::isspace(static_cast<unsigned char>(lower[pos - 1]))) continue;
        size_t start = pos + key.size();
        if (start >= tag.size()) return "";
        char quote = tag[start];
        if (quote == '"' || quote == '\'') {
            size_t end = tag.find(quote, start + 1);
            if (end == std::string::npos) return "";
            return tag.substr(start + 1, end - start - 1);
        }
        size_t end = tag.find_first_of(" \t\r\n", start);
        return tag.substr(start, end == std::string::npos ? std::string::npos : end - start);
    }
    return "";
}

static void append_utf8(std::string& out, unsigned long cp) {
    if (cp == 0 || cp > 0x10FFFF) return;
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

static std::string decode_entities(const std::string& s) {
    static const std::vector<std::pair<std::string, std::string>> named = {
        {"amp", "&"}, {"lt", "<"}, {"gt", ">"}, {"quot", "\""}, {"apos", "'"},
        {"nbsp", " "}, {"mdash", "-"}, {"ndash", "-"}, {"hellip", "..."}, {"copy", "(c)"}
    };
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] != '&') {
            out += s[i];
            continue;
        }
        size_t semi = s.find(';', i + 1);
        if (semi == std::string::npos || semi - i > 10) {
            out += s[i];
            continue;
        }
        std::string name = s.substr(i + 1, semi - i - 1);
        bool decoded = false;
        if (name.size() > 1 && name[0] == '#') {
            bool hex = name[1] == 'x' || name[1] == 'X';
            std::string digits = name.substr(hex ? 2 : 1);
            char* end = nullptr;
            unsigned long cp = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
            if (!digits.empty() && end && *end == '\0') {
                append_utf8(out, cp);
                decoded = true;
            }
        } else {
            for (auto& [n, v] : named) {
                if (n == name) {
                    out += v;
                    decoded = true;
                    break;
                }
            }
        }
        if (decoded) {
            i = semi;
        } else {
            out += s[i];
        }
    }
    return out;
}

namespace {

// Accumulates Markdown with collapsed whitespace outside <pre>.
class MarkdownWriter {
public:
    void text(const std::string& raw, bool verbatim) {
        std::string s = decode_entities(raw);
        if (verbatim) {
            out_ += s;
            pending_space_ = false;
            return;
        }
        for (char c : s) {
            if (std::isspace(static_cast<unsigned char>(c))) {
                pending_space_ = true;
                continue;
            }
            flush_space();
            out_ += c;
        }
    }

    // Opening markup takes the pending space before it; closing markup does not.
    void open(const std::string& markup) {
        flush_space();
        out_ += markup;
    }
    void close(const std::string& markup) { out_ += markup; }

    void line_break() {
        pending_space_ = false;
        out_ += "\n";
    }

    void block_break() {
        pending_space_ = false;
        if (out_.empty()) return;
        while (out_.size() < 2 || out_.compare(out_.size() - 2, 2, "\n\n") != 0) {
            if (!out_.empty() && out_.back() == ' ') {
                out_.pop_back();
                continue;
            }
            out_ += "\n";
        }
    }

    void new_line() {
        pending_space_ = false;
        if (!out_.empty() && out_.back() != '\n') out_ += "\n";
    }

    bool at_line_start() const { return out_.empty() || out_.back() == '\n'; }

    std::string finish() const {
        // Trailing spaces off every line, at most one blank line in a row
        std::istringstream in(out_);
        std::string line, result;
        int blanks = 0;
        while (std::getline(in, line)) {
            while (!line.empty() && (line.back() == ' ' || line.back() == '\t')) line.pop_back();
            if (line.empty()) {
                if (++blanks > 1 || result.empty()) continue;
            } else {
                blanks = 0;
            }
            result += line + "\n";
        }
        while (!result.empty() && result.back() == '\n') result.pop_back();
        return result;
    }

private:
    std::string out_;
    bool pending_space_ = false;

    void flush_space() {
        if (pending_space_ && !out_.empty() && out_.back() != '\n' && out_.back() != ' ') {
            out_ += ' ';
        }
        pending_space_ = false;
    }
};

} // namespace

std::string html_to_markdown(const std::string& html) {
    static const std::vector<std::string> skipped = {
        "script", "style", "noscript", "template", "svg", "head"
    };
    static const std::vector<std::string> blocks = {
        "p", "div", "section", "article", "header", "footer", "main", "aside", "nav",
        "table", "ul", "ol", "blockquote", "form", "figure", "dl"
    };
    auto contains = [](const std::vector<std::string>& v, const std::string& s) {
        return std::find(v.begin(), v.end(), s) != v.end();
    };

    MarkdownWriter md;
    std::string skip_until;     // closing tag that ends a skipped element
    std::string title;
    bool in_title = false;
    int pre_depth = 0;
    std::vector<int> lists;     // 0 for <ul>, next number for <ol>
    std::vector<std::string> links;

    size_t i = 0;
    while (i < html.size()) {
        if (html[i] != '<') {
            size_t next = html.find('<', i);
            if (next == std::string::npos) next = html.size();
            std::string run = html.substr(i, next - i);
            i = next;
            if (in_title) {
                title += run;
            } else if (skip_until.empty()) {
                md.text(run, pre_depth > 0);
            }
            continue;
        }

        if (html.compare(i, 4, "<!--") == 0) {
            size_t end = html.find("-->", i + 4);
            i = (end == std::string::npos) ? html.size() : end + 3;
            continue;
        }

        size_t close = html.find('>', i + 1);
        if (close == std::string::npos) {
            if (skip_until.empty()) md.text(html.substr(i), pre_depth > 0);
            break;
        }
        std::string tag = html.substr(i + 1, close - i - 1);
        i = close + 1;
        if (tag.empty() || tag[0] == '!' || tag[0] == '?') continue;

        bool closing = tag[0] == '/';
        std::string name = tag_name(tag);
        if (name.empty()) continue;

        if (name == "title") {
            in_title = !closing;
            continue;
        }
        if (!skip_until.empty()) {
            if (closing && name == skip_until) skip_until.clear();
            continue;
        }
        if (!closing && contains(skipped, name)) {
            if (tag.back() != '/') skip_until = name;
            continue;
        }

        if (name.size() == 2 && name[0] == 'h' && name[1] >= '1' && name[1] <= '6') {
            md.block_break();
            if (!closing) md.open(std::string(static_cast<size_t>(name[1] - '0'), '#') + " ");
        } else if (name == "pre") {
            if (closing) {
                if (pre_depth > 0) pre_depth--;
                md.new_line();
                md.close("```");
                md.block_break();
            } else {
                md.block_break();
                pre_depth++;
                md.open("```\n");
            }
        } else if (name == "code" && pre_depth == 0) {
            closing ? md.close("`") : md.open("`");
        } else if (name == "strong" || name == "b") {
            closing ? md.close("**") : md.open("**");
        } else if (name == "em" || name == "i") {
            closing ? md.close("*") : md.open("*");
        } else if (name == "br") {
            md.line_break();
        } else if (name == "hr") {
            md.block_break();
            md.open("---");
            md.block_break();
        } else if (name == "ul" || name == "ol") {
            if (closing) {
                if (!lists.empty()) lists.pop_back();
            } else {
                lists.push_back(name == "ol" ? 1 : 0);
            }
            if (lists.empty()) {
                md.block_break();
            } else {
                md.new_line();
            }
        } else if (name == "li") {
            if (closing) continue;
            md.new_line();
            std::string indent(lists.empty() ? 0 : (lists.size() - 1) * 2, ' ');
            if (!lists.empty() && lists.back() > 0) {
                md.open(indent + std::to_string(lists.back()++) + ". ");
            } else {
                md.open(indent + "- ");
            }
        } else if (name == "tr") {
            md.new_line();
        } else if (name == "td" || name == "th") {
            if (!closing && !md.at_line_start()) md.open("| ");
        } else if (name == "a") {
            if (closing) {
                if (links.empty()) continue;
                std::string href = links.back();
                links.pop_back();
                if (!href.empty()) md.close("](" + href + ")");
            } else {
                std::string href = tag_attribute(tag, "href");
                if (href.empty() || href[0] == '#' || lowercase(href).rfind("javascript:", 0) == 0) {
                    href.clear();
                } else {
                    md.open("[");
                }
                links.push_back(href);
            }
        } else if (name == "img") {
            std::string src = tag_attribute(tag, "src");
            if (!src.empty()) md.open("![" + decode_entities(tag_attribute(tag, "alt")) + "](" + src + ")");
        } else if (contains(blocks, name)) {
            md.block_break();
        }
    }

    std::string body = md.finish();
    std::string heading = title;
    heading.erase(0, heading.find_first_not_of(" \t\r\n"));
    while (!heading.empty() && std::isspace(static_cast<unsigned char>(heading.back()))) heading.pop_back();
    if (heading.empty() || body.rfind("# ", 0) == 0) return body;
    return "# " + decode_entities(heading) + (body.empty() ? "" : "\n\n" + body);
}

// ── Fetching ──

static bool is_url(const std::string& s) {
    return s.rfind("http://", 0) == 0 || s.rfind("https://", 0) == 0;
}

// Path and query of a URL without the fragment; "/" when absent.
static std::string request_target(const std::string& url) {
    size_t scheme_end = url.find("://");
    size_t start = (scheme_end == std::string::npos) ? 0 : scheme_end + 3;
    size_t slash = url.find('/', start);
    std::string target = (slash == std::string::npos) ? "/" : url.substr(slash);
    size_t hash = target.find('#');
    if (hash != std::string::npos) target.erase(hash);
    return target.empty() ? "/" : target;
}

static std::string fetch_page(const std::string& url, int timeout) {
    httplib::Client cli(parse_url(url).base());
    cli.set_follow_location(true);
    cli.set_connection_timeout(timeout);
    cli.set_read_timeout(timeout);

    httplib::Headers headers = {
        {"User-Agent", "strata/1.0"},
        {"Accept", "text/html,application/xhtml+xml;q=0.9,*/*;q=0.8"}
    };
    if (log_enabled(LogLevel::debug)) std::cerr << "[web] GET " << url << "\n";

    auto res = cli.Get(request_target(url), headers);
    if (!res) throw Error("cannot fetch " + url + ": " + httplib::to_string(res.error()));
    if (res->status < 200 || res->status >= 300) {
        throw Error("cannot fetch " + url + ": HTTP status " + std::to_string(res->status));
    }

    std::string type = lowercase(res->get_header_value("Content-Type"));
    size_t first = res->body.find_first_not_of(" \t\r\n");
    bool looks_html = type.find("html") != std::string::npos ||
                      (first != std::string::npos && res->body[first] == '<');
    return looks_html ? html_to_markdown(res->body) : res->body;
}

static std::string read_source(const std::string& source, const std::string& workdir, int timeout) {
    if (is_url(source)) return fetch_page(source, timeout);

    std::string path = expand_path(source);
    if (!path.empty() && path[0] != '/') path = (fs::path(workdir) / path).string();
    if (!fs::is_regular_file(path)) throw Error("not a URL or readable file: " + source);
    return html_to_markdown(read_file(path));
}

// ── Search ──

std::string format_search_results(const nlohmann::json& response, const std::string& query) {
    if (!response.is_object() || !response.contains("web") || !response["web"].is_object()) {
        return "No web results found for query: '" + query + "'";
    }
    auto& web = response["web"];
    if (!web.contains("results") || !web["results"].is_array() || web["results"].empty()) {
        return "No search results found for query: '" + query + "'";
    }

    std::ostringstream out;
    out << "Search results for '" << query << "' (" << web.value("totalCount", 0)
        << " total results):\n\n";
    int rank = 1;
    for (auto& r : web["results"]) {
        if (!r.is_object()) continue;
        out << "[" << rank++ << "] " << r.value("title", "No title") << " | "
            << r.value("url", "No URL") << " | " << r.value("description", "No description") << "\n";
    }
    return out.str();
}

static std::string search_failure(int status, const std::string& body, const std::string& key_env) {
    switch (status) {
    case 401: return "invalid or missing API key (check " + key_env + ")";
    case 403: return "access forbidden; check the subscription plan and key permissions";
    case 422: return "invalid request parameters: " + body;
    case 429: return "rate limit exceeded; wait before searching again";
    default: return "request failed with status " + std::to_string(status) + ": " + body;
    }
}

static std::string web_search(const nlohmann::json& args, const WebToolsOptions& opts) {
    const char* key = std::getenv(opts.api_key_env.c_str());
    if (!key || !*key) {
        throw Error(opts.api_key_env + " is not set; web_search needs a Brave Search API key");
    }

    if (!args.contains("query") || !args["query"].is_string()) {
        throw Error("query is required and must be a string");
    }
    std::string query = args["query"].get<std::string>();
    if (query.find_first_not_of(" \t\r\n") == std::string::npos) throw Error("query cannot be empty");
    if (query.size() > 400) throw Error("query too long: at most 400 characters");
    std::istringstream words(query);
    int word_count = 0;
    for (std::string w; words >> w;) word_count++;
    if (word_count > 50) throw Error("query has too many words: at most 50");

    int count = std::clamp(args.value("count", 20), 1, 20);
    int offset = std::clamp(args.value("offset", 0), 0, 9);

    // Only values that differ from the service defaults are sent
    httplib::Params params;
    params.emplace("q", query);
    if (count != 20) params.emplace("count", std::to_string(count));
    if (offset != 0) params.emplace("offset", std::to_string(offset));
    const std::vector<std::pair<std::string, std::string>> optional = {
        {"country", "US"}, {"search_lang", "en"}, {"ui_lang", "en-US"}, {"safesearch", "moderate"}
    };
    for (auto& [name, fallback] : optional) {
        std::string v = args.value(name, fallback);
        if (v != fallback) params.emplace(name, v);
    }
    std::string freshness = args.value("freshness", "");
    if (!freshness.empty()) params.emplace("freshness", freshness);

    httplib::Client cli(parse_url(opts.search_url).base());
    cli.set_connection_timeout(opts.timeout_seconds);
    cli.set_read_timeout(opts.timeout_seconds);
    httplib::Headers headers = {
        {"Accept", "application/json"},
        {"X-Subscription-Token", key}
    };
    if (log_enabled(LogLevel::debug)) {
        std::cerr << "[web] search '" << query << "' count=" << count << " offset=" << offset << "\n";
    }

    auto res = cli.Get(request_target(opts.search_url), params, headers);
    if (!res) throw Error("search request failed: " + httplib::to_string(res.error()));
    if (res->status < 200 || res->status >= 300) {
        throw Error("search " + search_failure(res->status, res->body, opts.api_key_env));
    }

    nlohmann::json response;
    try {
        response = nlohmann::json::parse(res->body);
    } catch (const nlohmann::json::exception& e) {
        throw Error(std::string("cannot parse search response: ") + e.what());
    }
    return format_search_results(response, query);
}

void register_web_tools(ToolRegistry& reg, const std::string& workdir, const WebToolsOptions& opts) {
    auto dir = std::make_shared<std::string>(workdir);
    auto options = std::make_shared<WebToolsOptions>(opts);

    {
        ToolDef def;
        def.name = "read_html";
        def.description = "Convert HTML from URLs or local files to Markdown. Pass one source as a "
                          "string or several as an array; each result is headed by its source.";
        def.parameters = nlohmann::json::parse(R"JSON({
            "type": "object",
            "properties": {
                "sources": {
                    "description": "URL(s) or file path(s) to convert",
                    "oneOf": [
                        {"type": "string"},
                        {"type": "array", "items": {"type": "string"}}
                    ]
                }
            },
            "required": ["sources"]
        })JSON");

        def.func = [dir, options](const nlohmann::json& args, const CancellationToken& token) -> std::string {
            std::vector<std::string> sources;
            auto it = args.find("sources");
            if (it != args.end() && it->is_string()) {
                sources.push_back(it->get<std::string>());
            } else if (it != args.end() && it->is_array()) {
                for (auto& s : *it) {
                    if (!s.is_string()) throw Error("sources must be strings");
                    sources.push_back(s.get<std::string>());
                }
            }
            if (sources.empty()) throw Error("sources is required (a string or an array of strings)");

            if (sources.size() == 1) {
                token.throw_if_cancelled();
                return read_source(sources[0], *dir, options->timeout_seconds);
            }

            // One bad source does not sink the batch
            std::string out;
            for (auto& source : sources) {
                token.throw_if_cancelled();
                if (!out.empty()) out += "\n\n---\n\n";
                out += "Source: " + source + "\n\n";
                try {
                    out += read_source(source, *dir, options->timeout_seconds);
                } catch (const Error& e) {
                    out += std::string("[error] ") + e.what();
                }
            }
            return out;
        };
        reg.register_tool(std::move(def));
    }

    {
        ToolDef def;
        def.name = "web_search";
        def.description = "Search the web with Brave Search. Returns one line per result: "
                          "[rank] title | URL | description. Needs " + opts.api_key_env + ".";
        def.parameters = nlohmann::json::parse(R"JSON({
            "type": "object",
            "properties": {
                "query": {"type": "string", "description": "Search query (site:, quotes and - work)"},
                "count": {"type": "integer", "minimum": 1, "maximum": 20, "default": 20},
                "offset": {"type": "integer", "minimum": 0, "maximum": 9, "default": 0},
                "country": {"type": "string", "default": "US"},
                "search_lang": {"type": "string", "default": "en"},
                "ui_lang": {"type": "string", "default": "en-US"},
                "safesearch": {"type": "string", "enum": ["strict", "moderate", "off"]},
                "freshness": {"type": "string", "enum": ["pd", "pw", "pm", "py"]}
            },
            "required": ["query"]
        })JSON");

        def.func = [options](const nlohmann::json& args, const CancellationToken& token) -> std::string {
            token.throw_if_cancelled();
            return web_search(args, *options);
        };
        reg.register_tool(std::move(def));
    }
}

} // namespace strata
