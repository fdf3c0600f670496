#pragma once

#include <string>

enum class ErrorCorrection { Low, Medium, High };

// Physical medium the codes end up on; drives the legibility limit
enum class PrintMedium { Png, Letter, IndexCard, PlayingCard };

struct SessionConfig {
    int capacity = 2900;                 // max bytes per frame, markers included
    ErrorCorrection error_correction = ErrorCorrection::Low;
    int pixel_density = 10;              // px per QR module in saved images
    std::string fill_color = "black";
    std::string back_color = "white";
    std::string directory;               // empty = current directory
    std::string name_override;           // extension of the source is always kept
    PrintMedium medium = PrintMedium::Png;
    bool archive = false;
    bool force_capacity = false;         // keep capacity even if it will not print legibly
    int camera_id = 0;
    int settle_frames = 200;
    bool assume_yes = false;
};

// "L", "M", "H" (case-insensitive); throws std::invalid_argument otherwise
ErrorCorrection parse_error_correction(const std::string& text);
const char* error_correction_name(ErrorCorrection level);

// "png", "letter", "index_card" (or "index"), "playing_card"
PrintMedium parse_print_medium(const std::string& text);
const char* print_medium_name(PrintMedium medium);
