#include "console_prompt.hpp"
#include "drive_errors.hpp"
#include <iostream>

static std::string read_answer(const std::string& prompt) {
    std::cout << prompt << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer))
        throw SessionCancelled("Input closed");
    return answer;
}

bool ask_yes_no(const std::string& question) {
    while (true) {
        std::string answer = read_answer(question + " Y/N  : ");
        if (answer == "Y" || answer == "y") return true;
        if (answer == "N" || answer == "n") return false;
    }
}

FrameDecision ask_frame_decision(const FrameConflict& conflict) {
    while (true) {
        if (conflict.index_mismatch) {
            std::cout << "The index of this QR code (" << *conflict.declared_index
                      << ") does not match the current index (" << conflict.position << ")." << std::endl;
        }
        if (conflict.index_missing) {
            std::cout << "The scanned QR code does not contain an index, "
                         "so we can't be sure you scanned them in order." << std::endl;
        }
        std::string answer = read_answer("Would you like to (A)ccept this code or (R)escan QR code " +
                                         std::to_string(conflict.position) + "? \n A/R : ");
        if (answer == "A" || answer == "a") return FrameDecision::Accept;
        if (answer == "R" || answer == "r") return FrameDecision::Reject;
    }
}
