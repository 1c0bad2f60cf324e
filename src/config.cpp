#include "config.hpp"
#include "errors.hpp"

#include <cmath>
#include <filesystem>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

long long parse_integer(const std::string& option, const std::string& text) {
    size_t used = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &used);
    } catch (const std::exception&) {
        throw InvalidConfiguration(option + " expects an integer, got '" + text + "'");
    }
    if (used != text.size())
        throw InvalidConfiguration(option + " expects an integer, got '" + text + "'");
    return value;
}

double parse_number(const std::string& option, const std::string& text) {
    size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &used);
    } catch (const std::exception&) {
        throw InvalidConfiguration(option + " expects a number, got '" + text + "'");
    }
    if (used != text.size() || !std::isfinite(value))
        throw InvalidConfiguration(option + " expects a number, got '" + text + "'");
    return value;
}

// Walks argv, handing out "--opt value" and "--opt=value" values.
class ArgCursor {
public:
    explicit ArgCursor(const std::vector<std::string>& args) : args_(args) {}

    bool done() const { return pos_ >= args_.size(); }
    const std::string& take() { return args_[pos_++]; }

    std::string value(const std::string& option, const std::string& inline_value, bool has_inline) {
        if (has_inline) return inline_value;
        if (done()) throw InvalidConfiguration(option + " requires a value");
        return take();
    }

private:
    const std::vector<std::string>& args_;
    size_t pos_ = 0;
};

void check_writable_parent(const std::string& path) {
    fs::path parent = fs::absolute(path).parent_path();
    if (access(parent.c_str(), W_OK) != 0)
        throw InvalidConfiguration("The directory '" + parent.string() + "' is not writable!");
}

} // namespace

CommandLine parse_command_line(const std::vector<std::string>& args) {
    CommandLine cl;
    std::vector<std::string> positional;
    ArgCursor cursor(args);

    while (!cursor.done()) {
        std::string arg = cursor.take();

        if (arg.size() < 2 || arg.compare(0, 2, "--") != 0 || arg == "--") {
            positional.push_back(arg);
            continue;
        }

        std::string name = arg;
        std::string inline_value;
        bool has_inline = false;
        size_t eq = arg.find('=');
        if (eq != std::string::npos) {
            name = arg.substr(0, eq);
            inline_value = arg.substr(eq + 1);
            has_inline = true;
        }

        if (name == "--help") {
            cl.mode = Mode::Help;
            return cl;
        } else if (name == "--silent") {
            cl.silent = true;
        } else if (name == "--zlib") {
            cl.tx.zlib = true;
        } else if (name == "--display") {
            cl.tx.display = true;
        } else if (name == "--bytes") {
            long long v = parse_integer(name, cursor.value(name, inline_value, has_inline));
            if (v <= 0) throw InvalidConfiguration("--bytes must be positive");
            cl.tx.segment_bytes = static_cast<size_t>(v);
        } else if (name == "--size") {
            long long v = parse_integer(name, cursor.value(name, inline_value, has_inline));
            if (v <= 0 || v > 100000) throw InvalidConfiguration("--size must be between 1 and 100000");
            cl.tx.frame.image_size = static_cast<int>(v);
        } else if (name == "--delay") {
            cl.tx.delay = parse_number(name, cursor.value(name, inline_value, has_inline));
        } else if (name == "--ver") {
            long long v = parse_integer(name, cursor.value(name, inline_value, has_inline));
            if (v < kMinQrVersion || v > kMaxQrVersion)
                throw InvalidConfiguration("--ver must be between 1 and 40");
            cl.tx.frame.qr_version = static_cast<int>(v);
        } else if (name == "--ec") {
            cl.tx.frame.level = parse_error_correction(cursor.value(name, inline_value, has_inline));
        } else if (name == "--timeout") {
            cl.rx.timeout = parse_number(name, cursor.value(name, inline_value, has_inline));
        } else if (name == "--workers") {
            long long v = parse_integer(name, cursor.value(name, inline_value, has_inline));
            if (v < 0 || v > 256) throw InvalidConfiguration("--workers must be between 0 and 256");
            cl.tx.workers = cl.rx.workers = static_cast<unsigned>(v);
        } else {
            throw InvalidConfiguration("unknown option '" + name + "'");
        }
    }

    if (positional.empty())
        throw InvalidConfiguration("missing mode (rx or tx)");

    const std::string& mode = positional[0];
    if (positional.size() > 3)
        throw InvalidConfiguration("unexpected argument '" + positional[3] + "'");

    if (mode == "tx") {
        cl.mode = Mode::Transmit;
        if (positional.size() < 2) throw InvalidConfiguration("tx requires a payload file");
        cl.tx.payload_path = positional[1];
        if (positional.size() > 2) cl.tx.outfile = positional[2];
    } else if (mode == "rx") {
        cl.mode = Mode::Receive;
        if (positional.size() < 2) throw InvalidConfiguration("rx requires a source");
        cl.rx.source = positional[1];
        if (positional.size() > 2) cl.rx.outfile = positional[2];
    } else {
        throw InvalidConfiguration("unknown mode '" + mode + "' (expected rx or tx)");
    }

    return cl;
}

void validate_transmit_config(const TransmitConfig& config) {
    std::error_code ec;
    if (config.payload_path.empty() || !fs::is_regular_file(config.payload_path, ec))
        throw InvalidConfiguration("The file '" + config.payload_path + "' does not exist!");
    if (access(config.payload_path.c_str(), R_OK) != 0)
        throw InvalidConfiguration("The file '" + config.payload_path + "' is not readable!");

    if (!config.outfile.empty())
        check_writable_parent(config.outfile);

    if (config.segment_bytes == 0)
        throw InvalidConfiguration("--bytes must be positive");
    if (!(config.delay > 0.0) || !std::isfinite(config.delay))
        throw InvalidConfiguration("--delay must be a positive number of seconds");

    int minimum = qr_modules_with_quiet_zone(config.frame.qr_version);
    if (config.frame.image_size < minimum)
        throw InvalidConfiguration("--size " + std::to_string(config.frame.image_size) +
                                   " is below the " + std::to_string(minimum) +
                                   " px minimum of a version " +
                                   std::to_string(config.frame.qr_version) + " QR code");
}

void validate_receive_config(const ReceiveConfig& config) {
    if (config.source.empty())
        throw InvalidConfiguration("missing receive source");
    if (!config.outfile.empty())
        check_writable_parent(config.outfile);
    if (config.timeout < 0.0 || !std::isfinite(config.timeout))
        throw InvalidConfiguration("--timeout must not be negative");
}

unsigned resolve_workers(unsigned requested) {
    if (requested > 0) return requested;
    unsigned hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 2;
}

std::string usage(const std::string& program) {
    return "Usage: " + program + " [--silent] <mode> ...\n"
        "\n"
        "  " + program + " tx <payload> [outfile] [options]   transmit mode\n"
        "      --bytes N      bytes per frame (default: 1024)\n"
        "      --zlib         use zlib compression\n"
        "      --size N       qr code image size (default: 450)\n"
        "      --delay F      delay between qr code images (default: 1)\n"
        "      --ver N        qr code version (default: 25)\n"
        "      --ec L|M|Q|H   qr code error correction level (default: L)\n"
        "      --display      display qr code images (default if no outfile)\n"
        "      outfile        output animated gif image\n"
        "\n"
        "  " + program + " rx <source> [outfile] [options]    receive mode\n"
        "      source         camera index, image, animated gif / video, or directory of images\n"
        "      outfile        received payload (default: stdout)\n"
        "      --timeout F    give up after F seconds without a new frame (default: 0, never)\n"
        "\n"
        "  --workers N        encode / decode threads (default: hardware concurrency)\n"
        "  --silent           silence console output\n";
}
