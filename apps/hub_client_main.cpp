#include "hub_client/hub_client_core.hpp"
#include "nlohmann/json.hpp"
#include <iostream>
#include <fstream>
#include <string>

int main(int argc, char* argv[]) {
    try {
        // 加载配置文件，可通过第一个参数指定路径
        std::string const config_path = argc > 1 ? argv[1] : "../config/hub_client_config.json";
        std::ifstream config_file(config_path);
        if (!config_file.is_open()) {
            std::cerr << "Error: Could not open " << config_path << std::endl;
            return EXIT_FAILURE;
        }

        nlohmann::json config;
        config_file >> config;

        hub_client::HubClientCore core(hub_client::load_settings(config));
        core.run(std::cin, std::cout);

    } catch (const nlohmann::json::exception& e) {
        std::cerr << "JSON configuration error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
