#include "engine.hpp"

extern Engine *createApp();

int main(int argc, char **argv) {
    Engine *engine = createApp();
    if (argc > 1)
        engine->setConfigFile(argv[1]);

    int status = EXIT_SUCCESS;
    try {
        engine->run();
    } catch (const std::exception &e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        status = EXIT_FAILURE;
    }
    delete engine;
    return status;
}
