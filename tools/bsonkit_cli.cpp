#include "bsonkit/bson.hpp"

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <locale>
#include <set>
#include <sstream>
#include <string>
#include <vector>

// FTXUI TUI
#include <ftxui/component/component.hpp>
#include <ftxui/component/component_base.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>

#if !defined(_WIN32)
#include <unistd.h>
#endif

namespace {

struct Ansi {
    bool enabled{true};

    std::string reset() const { return enabled ? "\x1b[0m" : ""; }
    std::string dim() const { return enabled ? "\x1b[2m" : ""; }
    std::string bold() const { return enabled ? "\x1b[1m" : ""; }
    std::string red() const { return enabled ? "\x1b[31m" : ""; }
    std::string yellow() const { return enabled ? "\x1b[33m" : ""; }
    std::string magenta() const { return enabled ? "\x1b[35m" : ""; }
    std::string cyan() const { return enabled ? "\x1b[36m" : ""; }
    std::string gray() const { return enabled ? "\x1b[90m" : ""; }
};

static bool is_tty() {
#if defined(_WIN32)
    return false;
#else
    return ::isatty(fileno(stdout));
#endif
}

static std::string hex8(std::uint32_t v) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setw(8) << std::setfill('0') << v;
    return oss.str();
}

static void usage() {
    std::cerr <<
        "bsonkit (C++) - BSON document inspector\n"
        "\n"
        "Usage:\n"
        "  bsonkit info <FILE> [--strict] [--no-color]\n"
        "  bsonkit tree <FILE> [--prefix <P>] [--max-depth N] [--details] [--strict] [--no-color]\n"
        "  bsonkit json <FILE> [--pretty] [--strict]\n"
        "  bsonkit show <FILE> [<PATH>] [--strict]\n";
}

struct Args {
    std::string cmd;
    std::string file;
    std::string path;
    bool strict{false};
    bool details{false};
    bool pretty{false};
    bool no_color{false};
    std::string prefix;
    std::size_t max_depth{static_cast<std::size_t>(-1)};
};

static bool parse_args(int argc, char** argv, Args& a) {
    if (argc < 3) return false;
    a.cmd = argv[1];
    a.file = argv[2];

    int i = 3;
    // positional path for show
    if (a.cmd == "show" && i < argc && std::string(argv[i]).rfind("--", 0) != 0) {
        a.path = argv[i++];
    }

    while (i < argc) {
        std::string opt = argv[i++];
        if (opt == "--strict") a.strict = true;
        else if (opt == "--details") a.details = true;
        else if (opt == "--pretty") a.pretty = true;
        else if (opt == "--no-color") a.no_color = true;
        else if (opt == "--prefix" && i < argc) a.prefix = argv[i++];
        else if (opt == "--max-depth" && i < argc) a.max_depth = static_cast<std::size_t>(std::stoull(argv[i++]));
        else {
            std::cerr << "Unknown option: " << opt << "\n";
            return false;
        }
    }

    if (a.cmd != "info" && a.cmd != "tree" && a.cmd != "json" && a.cmd != "show") {
        std::cerr << "Unknown command: " << a.cmd << "\n";
        return false;
    }
    return true;
}

// ----------------- Value summaries -----------------

static std::string clip(const std::string& s, std::size_t max_len) {
    if (s.size() <= max_len) return s;
    return s.substr(0, max_len) + "...";
}

// One-line rendering used by the tree and the browser list.
static std::string summary(const bsonkit::Value& v) {
    if (v.is_document()) {
        return "{" + std::to_string(v.as_document().size()) + " fields}";
    }
    if (v.is_array()) {
        return "[" + std::to_string(v.as_array().size()) + " items]";
    }
    if (v.is_binary()) {
        return "<" + std::to_string(v.as_binary().size()) + " bytes>";
    }
    return clip(bsonkit::to_json(v), 40);
}

static std::string details_of(const bsonkit::Value& v) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << "kind=" << bsonkit::to_string(v.type());
    if (v.is_string()) oss << " bytes=" << v.as_string().size();
    if (v.is_binary()) oss << " subtype=00";
    if (v.is_datetime()) oss << " tz=" << v.as_datetime().timezone;
    if (v.is_document()) oss << " encoded=" << bsonkit::Mapper().marshal(v.as_document()).size() << "B";
    return oss.str();
}

// ----------------- Tree printer -----------------

static void print_tree(
    const bsonkit::Value& node,
    const Ansi& ansi,
    std::size_t indent,
    std::size_t depth,
    std::size_t max_depth,
    bool details
) {
    if (depth > max_depth) return;

    auto emit = [&](const std::string& name, const bsonkit::Value& child) {
        std::string pad(indent, ' ');
        bool is_dir = child.is_document() || child.is_array();

        if (is_dir) {
            std::cout << pad
                      << ansi.magenta() << name << "/" << ansi.reset()
                      << " " << ansi.yellow() << bsonkit::type_name(child) << ansi.reset()
                      << " " << ansi.gray() << summary(child) << ansi.reset();
        } else {
            std::cout << pad
                      << ansi.cyan() << name << ansi.reset()
                      << " " << ansi.yellow() << bsonkit::type_name(child) << ansi.reset()
                      << " " << ansi.gray() << summary(child) << ansi.reset();
        }
        if (details) {
            std::cout << " " << ansi.dim() << details_of(child) << ansi.reset();
        }
        std::cout << "\n";

        if (is_dir) print_tree(child, ansi, indent + 2, depth + 1, max_depth, details);
    };

    if (node.is_document()) {
        for (const auto& kv : node.as_document()) emit(bsonkit::to_string(kv.first), kv.second);
    } else if (node.is_array()) {
        const auto& arr = node.as_array();
        for (std::size_t i = 0; i < arr.size(); ++i) emit("[" + std::to_string(i) + "]", arr[i]);
    }
}

// ----------------- Interactive UI tree (FTXUI) -----------------

struct UiNode {
    std::string name;
    std::string full_path; // dot-separated; empty for root
    const bsonkit::Value* value{nullptr};
    std::vector<UiNode> children;
};

struct UiRow {
    const UiNode* node{nullptr};
    int depth{0};
    bool is_dir{false};
};

static std::string field_name(const bsonkit::Key& k) {
    return bsonkit::is_text(k) ? std::get<std::string>(k) : bsonkit::to_string(k);
}

static void ui_build(UiNode& node) {
    const bsonkit::Value& v = *node.value;
    auto child_path = [&](const std::string& part) {
        return node.full_path.empty() ? part : node.full_path + "." + part;
    };
    if (v.is_document()) {
        for (const auto& kv : v.as_document()) {
            UiNode c;
            c.name = field_name(kv.first);
            c.full_path = child_path(c.name);
            c.value = &kv.second;
            ui_build(c);
            node.children.push_back(std::move(c));
        }
    } else if (v.is_array()) {
        const auto& arr = v.as_array();
        for (std::size_t i = 0; i < arr.size(); ++i) {
            UiNode c;
            c.name = std::to_string(i);
            c.full_path = child_path(c.name);
            c.value = &arr[i];
            ui_build(c);
            node.children.push_back(std::move(c));
        }
    }
}

static const UiNode* ui_find(const UiNode& root, const std::string& path) {
    if (root.full_path == path) return &root;
    for (const auto& c : root.children) {
        if (path == c.full_path || path.rfind(c.full_path + ".", 0) == 0) {
            return ui_find(c, path);
        }
    }
    return nullptr;
}

static void flatten_rows(const UiNode& node,
                         const std::set<std::string>& expanded,
                         int depth,
                         std::vector<UiRow>& out) {
    // Root itself is not rendered; render its children.
    for (const auto& child : node.children) {
        bool is_dir = child.value->is_document() || child.value->is_array();
        out.push_back(UiRow{&child, depth, is_dir});
        if (is_dir && expanded.find(child.full_path) != expanded.end()) {
            flatten_rows(child, expanded, depth + 1, out);
        }
    }
}

static std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    cur.reserve(128);
    for (char ch : s) {
        if (ch == '\r') continue;
        if (ch == '\n') {
            out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(ch);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

// Pretty JSON with keys and string values picked out.
static ftxui::Element render_preview_colored(const std::string& preview) {
    using namespace ftxui;

    auto lines = split_lines(preview);
    if (lines.empty()) {
        return text("(no preview)") | color(Color::GrayDark);
    }

    std::vector<Element> els;
    els.reserve(lines.size());
    for (const auto& line : lines) {
        std::size_t lead = line.find_first_not_of(' ');
        if (lead == std::string::npos) {
            els.push_back(text(line));
            continue;
        }
        std::string pad = line.substr(0, lead);
        std::string rest = line.substr(lead);

        auto sep = rest.find("\": ");
        if (!rest.empty() && rest.front() == '"' && sep != std::string::npos) {
            std::string k = rest.substr(0, sep + 1);
            std::string v = rest.substr(sep + 3);
            Color vc = (!v.empty() && v.front() == '"') ? Color::Green : Color::GrayLight;
            els.push_back(hbox({
                text(pad),
                text(k) | bold | color(Color::Yellow),
                text(": ") | color(Color::GrayDark),
                text(v) | color(vc) | flex,
            }));
            continue;
        }
        Color c = (rest.front() == '"') ? Color::Green : Color::White;
        els.push_back(hbox({text(pad), text(rest) | color(c)}));
    }
    return vbox(std::move(els));
}

// Tree of the document on the left, pretty JSON of the selection on the
// right, one status line underneath.
static int run_browser(const Args& a, const Ansi& ansi, const bsonkit::Value& doc) {
    UiNode root;
    root.name = "<root>";
    root.value = &doc;
    ui_build(root);

    const UiNode* start = &root;
    if (!a.path.empty() && a.path != "<root>") {
        start = ui_find(root, a.path);
        if (!start) {
            std::cerr << ansi.red() << "Error" << ansi.reset() << ": path not found: " << a.path << "\n";
            return 2;
        }
    }

    using namespace ftxui;

    std::set<std::string> expanded;
    std::vector<UiRow> rows;
    int selected = 0;

    auto refresh_rows = [&] {
        rows.clear();
        flatten_rows(*start, expanded, 0, rows);
        selected = std::clamp(selected, 0, std::max(0, (int)rows.size() - 1));
    };
    refresh_rows();

    auto current = [&]() -> const UiNode& {
        return rows.empty() ? *start : *rows[(std::size_t)selected].node;
    };

    // JSON is re-rendered only when the selection lands on another path.
    std::string preview_path = "\x01";
    std::string preview;
    std::string preview_error;
    auto sync_preview = [&] {
        const UiNode& n = current();
        if (n.full_path == preview_path) return;
        preview_path = n.full_path;
        preview_error.clear();
        try {
            preview = bsonkit::to_json(*n.value, true);
        } catch (const bsonkit::BsonError& e) {
            preview.clear();
            preview_error = e.what();
        }
    };

    auto view = Renderer([&] {
        sync_preview();

        std::vector<Element> lines;
        lines.reserve(rows.size());
        for (int i = 0; i < (int)rows.size(); ++i) {
            const UiRow& r = rows[(std::size_t)i];
            std::string marker = "  ";
            if (r.is_dir) marker = expanded.count(r.node->full_path) ? "- " : "+ ";
            Element line = hbox({
                text(std::string((std::size_t)r.depth * 2, ' ') + marker),
                text(r.node->name) | color(r.is_dir ? Color::Magenta : Color::Cyan),
                text(" "),
                text(bsonkit::type_name(*r.node->value)) | color(Color::Yellow),
                filler(),
                text(summary(*r.node->value)) | color(Color::GrayDark),
            });
            // focus keeps the selected row inside the frame
            if (i == selected) line = line | inverted | focus;
            lines.push_back(line);
        }
        if (lines.empty()) lines.push_back(text("(empty)") | color(Color::GrayDark));

        const UiNode& sel = current();
        Element right = preview_error.empty()
            ? render_preview_colored(preview)
            : text(preview_error) | color(Color::Red);

        Element status = hbox({
            text(" " + (sel.full_path.empty() ? std::string("<root>") : sel.full_path) + " ") | bold | color(Color::Green),
            text(details_of(*sel.value)) | color(Color::GrayLight),
            filler(),
            text("q quit  arrows move/expand  Home/End ") | color(Color::GrayDark),
        });

        return vbox({
                   text(" " + a.file + " ") | bold,
                   separator(),
                   hbox({
                       vbox(std::move(lines)) | vscroll_indicator | frame | size(WIDTH, EQUAL, 56),
                       separator(),
                       right | vscroll_indicator | frame | flex,
                   }) | flex,
                   separator(),
                   status,
               }) |
               border;
    });

    auto screen = ScreenInteractive::Fullscreen();

    auto app = CatchEvent(view, [&](Event e) {
        if (e == Event::Character('q') || e == Event::Escape) {
            screen.Exit();
            return true;
        }
        if (rows.empty()) return false;

        const UiRow& r = rows[(std::size_t)selected];
        int last = (int)rows.size() - 1;

        if (e == Event::ArrowUp || e == Event::Character('k')) {
            selected = std::max(0, selected - 1);
            return true;
        }
        if (e == Event::ArrowDown || e == Event::Character('j')) {
            selected = std::min(last, selected + 1);
            return true;
        }
        if (e == Event::Home) {
            selected = 0;
            return true;
        }
        if (e == Event::End) {
            selected = last;
            return true;
        }
        if (e == Event::ArrowRight || e == Event::Return) {
            if (r.is_dir && expanded.insert(r.node->full_path).second) refresh_rows();
            return true;
        }
        if (e == Event::ArrowLeft) {
            if (r.is_dir && expanded.erase(r.node->full_path) > 0) {
                refresh_rows();
                return true;
            }
            // otherwise jump to the enclosing container
            int depth = r.depth;
            for (int i = selected - 1; i >= 0; --i) {
                if (rows[(std::size_t)i].depth < depth) {
                    selected = i;
                    break;
                }
            }
            return true;
        }
        return false;
    });

    screen.Loop(app);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Args a;
    if (!parse_args(argc, argv, a)) {
        usage();
        return 2;
    }

    Ansi ansi;
    ansi.enabled = !a.no_color && is_tty();

    try {
        if (a.cmd == "info") {
            bsonkit::FileInfo info = bsonkit::read_file_info(a.file);

            std::cout << ansi.bold() << "File" << ansi.reset() << ": " << a.file << "\n";
            std::cout << ansi.bold() << "File size" << ansi.reset() << ": " << info.file_size << "\n";
            std::cout << ansi.bold() << "Compression" << ansi.reset() << ": " << (info.compressed ? "gzip" : "none") << "\n";
            std::cout << ansi.bold() << "Document size" << ansi.reset() << ": " << info.document_size << " bytes\n";
            std::cout << ansi.bold() << "Document CRC" << ansi.reset() << ": " << hex8(info.crc32) << "\n";
            std::cout << ansi.bold() << "Top-level fields" << ansi.reset() << ": " << info.field_count << "\n";

            // full decode surfaces anything the framing walk does not check
            (void)bsonkit::read_file(a.file, bsonkit::ReadOptions{a.strict});
            std::cout << ansi.dim() << "(document decodes cleanly" << (a.strict ? " in strict mode" : "") << ")\n"
                      << ansi.reset();
            return 0;
        }

        bsonkit::Value root = bsonkit::read_file(a.file, bsonkit::ReadOptions{a.strict});

        if (a.cmd == "json") {
            std::cout << bsonkit::to_json(root, a.pretty) << "\n";
            return 0;
        }

        if (a.cmd == "tree") {
            const bsonkit::Value* node = &root;
            if (!a.prefix.empty()) {
                try {
                    node = &bsonkit::lookup(root, a.prefix);
                } catch (const bsonkit::BsonError& e) {
                    if (e.kind() != bsonkit::ErrorKind::NotFound) throw;
                    std::cerr << "prefix not found: " << a.prefix << "\n";
                    return 2;
                }
                std::cout << ansi.dim() << "prefix: " << a.prefix << ansi.reset() << "\n";
            }

            std::cout << ansi.bold() << "BSON document tree" << ansi.reset() << ": " << a.file << "\n";
            print_tree(*node, ansi, 0, 0, a.max_depth, a.details);
            return 0;
        }

        if (a.cmd == "show") {
            return run_browser(a, ansi, root);
        }

    } catch (const bsonkit::BsonError& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << " [" << bsonkit::to_string(e.kind()) << "]: "
                  << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << ": " << e.what() << "\n";
        return 1;
    }

    usage();
    return 2;
}
