// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Исключения перехватываются на границе main и превращаются в exit code 1.
//
// ==============================================================================

#include "bilicache/app.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        return bilicache::app::run_cli(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "[x] Unknown error occurred\n";
        return 1;
    }
}
