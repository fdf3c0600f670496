#include "console_prompt.hpp"
#include "drive_errors.hpp"
#include "drive_pipeline.hpp"
#include "session_config.hpp"

#include <iostream>
#include <string>
#include <vector>

static void print_usage(const char* argv0) {
    std::cerr << "Usage:\n"
              << "  " << argv0 << " -s <file>  [options]   save file to QR code images\n"
              << "  " << argv0 << " -l <base>  [options]   load '<base>.<0-9>.png' images\n"
              << "  " << argv0 << " -c         [options]   load from a webcam\n"
              << "Options:\n"
              << "  -d, --directory <dir>          where output files are written\n"
              << "  -n, --name <name>              output name (the file type is kept)\n"
              << "  -b, --bytesize <n>             max bytes per QR code (max 2953, default 2900)\n"
              << "  -e, --errorcorrection <L|M|H>  error correction level (default L)\n"
              << "  -m, --medium <png|letter|index_card|playing_card>\n"
              << "      --force-capacity           keep bytesize even if codes won't print legibly\n"
              << "  -z, --archive                  gzip the file before encoding\n"
              << "  -px, --pixeldensity <n>        pixels per QR module (default 10)\n"
              << "  -f, --fillcolor <color>        dark color, name or #RRGGBB (default black)\n"
              << "  -w, --whitebackgroundcolor <c> light color (default white)\n"
              << "      --camera-id <n>            webcam index (default 0)\n"
              << "      --settle-frames <n>        frames to wait before taking a code (default 200)\n"
              << "  -y, --yes                      don't ask for confirmation\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    SessionConfig config;
    std::string save_path, load_base;
    bool camera = false;

    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& a = args[i];
            auto value = [&]() -> const std::string& {
                if (i + 1 >= args.size()) throw std::invalid_argument("Missing value for " + a);
                return args[++i];
            };

            if (a == "-s" || a == "--save") save_path = value();
            else if (a == "-l" || a == "--load") load_base = value();
            else if (a == "-c" || a == "--camera") camera = true;
            else if (a == "-d" || a == "--directory") config.directory = value();
            else if (a == "-n" || a == "--name") config.name_override = value();
            else if (a == "-b" || a == "--bytesize") config.capacity = std::stoi(value());
            else if (a == "-e" || a == "--errorcorrection") config.error_correction = parse_error_correction(value());
            else if (a == "-m" || a == "--medium") config.medium = parse_print_medium(value());
            else if (a == "--force-capacity") config.force_capacity = true;
            else if (a == "-z" || a == "--archive") config.archive = true;
            else if (a == "-px" || a == "--pixeldensity") config.pixel_density = std::stoi(value());
            else if (a == "-f" || a == "--fillcolor") config.fill_color = value();
            else if (a == "-w" || a == "--whitebackgroundcolor") config.back_color = value();
            else if (a == "--camera-id") config.camera_id = std::stoi(value());
            else if (a == "--settle-frames") config.settle_frames = std::stoi(value());
            else if (a == "-y" || a == "--yes") config.assume_yes = true;
            else if (a == "-h" || a == "--help") { print_usage(argv[0]); return 0; }
            else throw std::invalid_argument("Unknown option " + a);
        }
    } catch (const std::exception& e) {
        std::cerr << "[CLI] " << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    DrivePrompts prompts;
    prompts.confirm_save = [](std::size_t count) {
        return ask_yes_no("\nThat file would save as " + std::to_string(count) + " QR code(s). Continue?");
    };
    prompts.decide_frame = ask_frame_decision;
    prompts.scan_another = [](std::size_t next) {
        return ask_yes_no("\nQR code " + std::to_string(next - 1) + " found. Scan another?");
    };

    try {
        if (!save_path.empty()) {
            run_save(save_path, config, prompts);
        } else if (!load_base.empty()) {
            MaterializedFile out = run_load(load_base, config);
            std::cout << "[LOAD] Output: " << out.path << std::endl;
        } else if (camera) {
            MaterializedFile out = run_camera_load(config, prompts);
            std::cout << "[LOAD] Output: " << out.path << std::endl;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    } catch (const SessionCancelled& e) {
        std::cerr << "\n" << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 2;
    }

    return 0;
}
