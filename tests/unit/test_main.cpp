// test_main.cpp - Catch2 session owning the embedded Python runtime

#include <catch2/catch_session.hpp>
#include <scriptbox/scriptbox.h>
#include <iostream>

int main(int argc, char* argv[]) {
    scriptbox::InitializeLogging("warn");

    if (!scriptbox::Initialize()) {
        std::cerr << "Failed to initialize the embedded Python runtime" << std::endl;
        return 1;
    }

    int result = Catch::Session().run(argc, argv);

    scriptbox::Shutdown();
    return result;
}
