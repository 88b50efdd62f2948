#include "vole/app.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        vole::App app;
        return app.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "vole: " << e.what() << '\n';
        return 1;
    }
}
