#include "App/CommandLine.h"
#include "VideoOutputStream/GstreamerFileOutput.h"

#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace {

int to_int(const std::string& text, const std::string& what)
{
    try {
        std::size_t used = 0;
        const int value = std::stoi(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid " + what + ": '" + text + "'");
    }
}

double to_double(const std::string& text, const std::string& what)
{
    try {
        std::size_t used = 0;
        const double value = std::stod(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid " + what + ": '" + text + "'");
    }
}

std::vector<std::string> split(const std::string& text, char sep)
{
    std::vector<std::string> parts;
    std::istringstream iss(text);
    std::string part;
    while (std::getline(iss, part, sep)) {
        parts.push_back(part);
    }
    return parts;
}

// "x,y,w,h"
cv::Rect parse_rect(const std::string& text)
{
    const auto parts = split(text, ',');
    if (parts.size() != 4) {
        throw std::invalid_argument("--rect expects x,y,w,h, got '" + text + "'");
    }
    cv::Rect r(to_int(parts[0], "rect x"), to_int(parts[1], "rect y"),
               to_int(parts[2], "rect width"), to_int(parts[3], "rect height"));
    if (r.x < 0 || r.y < 0 || r.width <= 0 || r.height <= 0) {
        throw std::invalid_argument("--rect needs x,y >= 0 and a positive size");
    }
    return r;
}

// "WxH"
cv::Size parse_size(const std::string& text)
{
    const auto x_pos = text.find('x');
    if (x_pos == std::string::npos) {
        throw std::invalid_argument("--canvas expects WxH, got '" + text + "'");
    }
    cv::Size s(to_int(text.substr(0, x_pos), "canvas width"),
               to_int(text.substr(x_pos + 1), "canvas height"));
    if (s.width <= 0 || s.height <= 0) {
        throw std::invalid_argument("--canvas needs a positive size");
    }
    return s;
}

} // namespace

std::string default_output_path(const std::string& input_path)
{
    const std::filesystem::path in(input_path);
    return (in.parent_path() / (in.stem().string() + "_cropped.mp4")).string();
}

std::string usage(const std::string& program)
{
    std::ostringstream oss;
    oss << "Usage: " << program << " <input_video> [output_file] [options]\n"
        << "\n"
        << "  input_video          .mp4, .avi or .mov\n"
        << "  output_file          .mp4 (default: <input>_cropped.mp4)\n"
        << "\n"
        << "  --square             start in square mode\n"
        << "  --rect x,y,w,h       crop this source rectangle without the window\n"
        << "  --encoder NAME       x264 (default), h264, x265, h265\n"
        << "  --canvas WxH         largest preview canvas (default 1280x720)\n"
        << "  --min-size N         smallest selection accepted on commit, in preview\n"
        << "                       pixels (default 0: any non-empty selection)\n"
        << "  --handle-radius N    handle grab distance in pixels (default 10)\n"
        << "  -h, --help           show this text\n"
        << "\n"
        << "Window keys: drag to select, Shift or 's' for square, 'r' reset,\n"
        << "             'c'/Enter commit, Esc/'q' cancel.\n";
    return oss.str();
}

AppConfig parse_command_line(int argc, const char* const argv[])
{
    AppConfig cfg;
    std::vector<std::string> positional;

    const auto value_of = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument(flag + " needs a value");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            cfg.show_help = true;
            return cfg;
        } else if (arg == "--square") {
            cfg.square_mode = true;
        } else if (arg == "--rect") {
            cfg.rect = parse_rect(value_of(i, arg));
        } else if (arg == "--encoder") {
            cfg.encoder = value_of(i, arg);
            if (!GstreamerFileOutput::supports_encoder(cfg.encoder)) {
                throw std::invalid_argument("Unknown encoder: " + cfg.encoder);
            }
        } else if (arg == "--canvas") {
            cfg.max_canvas = parse_size(value_of(i, arg));
        } else if (arg == "--min-size") {
            cfg.min_size = to_double(value_of(i, arg), "minimum size");
        } else if (arg == "--handle-radius") {
            cfg.handle_radius = to_double(value_of(i, arg), "handle radius");
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        throw std::invalid_argument("No input video given");
    }
    if (positional.size() > 2) {
        throw std::invalid_argument("Too many arguments: " + positional[2]);
    }

    cfg.input_path  = positional[0];
    cfg.output_path = positional.size() > 1 ? positional[1]
                                            : default_output_path(cfg.input_path);

    if (cfg.min_size < 0.0 || cfg.handle_radius < 0.0) {
        throw std::invalid_argument("--min-size and --handle-radius must be >= 0");
    }
    return cfg;
}
