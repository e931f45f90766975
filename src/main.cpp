/**
 * @file main.cpp
 * @brief Точка входа утилиты ergo-address
 *
 * Кодирует и декодирует адреса Ergo (P2PK, P2SH, P2S) для
 * mainnet, testnet или произвольного префикса сети.
 *
 * Использование:
 *   ergo-address [options] <command> [args]
 *
 * Команды:
 *   decode <address>                 Показать сеть, тип и содержимое
 *   encode <p2pk|p2sh|p2s> <hex>     Закодировать содержимое в адрес
 *   p2sh-from-script <hex>           P2SH адрес из сериализованного скрипта
 *   check-p2pk <address>             Код возврата 0, если адрес P2PK
 *
 * Коды возврата: 0 - успех, 1 - ошибка адреса/аргументов, 2 - ошибка конфигурации
 */

#include "core/types.hpp"
#include "core/config.hpp"
#include "address/address.hpp"
#include "address/encoder.hpp"
#include "address/network.hpp"
#include "encoding/hex.hpp"
#include "log/console_log.hpp"

#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

/// @brief Версия программы
constexpr std::string_view VERSION = "1.0.0";

constexpr int EXIT_ADDRESS_ERROR = 1;
constexpr int EXIT_CONFIG_ERROR = 2;

/**
 * @brief Вывести справку
 */
void print_help() {
    std::cout << R"(
ergo-address v)" << VERSION << R"(
Кодирование и декодирование адресов Ergo

ИСПОЛЬЗОВАНИЕ:
    ergo-address [ОПЦИИ] <КОМАНДА> [АРГУМЕНТЫ]

КОМАНДЫ:
    decode <address>                 Показать сеть, тип и содержимое адреса
    encode <p2pk|p2sh|p2s> <hex>     Закодировать содержимое в адрес
    p2sh-from-script <hex>           P2SH адрес из сериализованного скрипта
    check-p2pk <address>             Код возврата 0, если адрес P2PK

ОПЦИИ:
    -c, --config PATH    Путь к файлу конфигурации (ergo-address.toml)
    -n, --network NAME   mainnet | testnet | 0..255 (перекрывает конфигурацию)
    -q, --quiet          Выводить только результат и ошибки
    -h, --help           Показать эту справку
    -v, --version        Показать версию программы

ПРИМЕРЫ:
    ergo-address decode 9fRAWhdxEsTcdb8PhGNrZfwqa65zfkuYHAMmkQLcic1gdLSV5vA
    ergo-address -n testnet encode p2s 10010101d17300

)";
}

/**
 * @brief Парсинг аргументов командной строки
 */
struct Args {
    std::optional<std::string> config_path;
    std::optional<std::string> network;
    std::vector<std::string> positional;
    bool quiet = false;
    bool show_help = false;
    bool show_version = false;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if ((arg == "-n" || arg == "--network") && i + 1 < argc) {
            args.network = argv[++i];
        } else {
            args.positional.emplace_back(arg);
        }
    }

    return args;
}

/**
 * @brief Построить адрес из типа и содержимого
 */
ergo::Result<ergo::address::Address> make_address(std::string_view type, ergo::Bytes content) {
    using namespace ergo::address;

    if (type == "p2pk") {
        return P2PKAddress(std::move(content));
    }
    if (type == "p2s") {
        return Pay2SAddress(std::move(content));
    }
    if (type == "p2sh") {
        auto p2sh = Pay2SHAddress::create(std::move(content));
        if (!p2sh) {
            return std::unexpected(p2sh.error());
        }
        return std::move(*p2sh);
    }

    return ergo::Err<Address>(
        ergo::ErrorCode::AddressUnsupportedType,
        std::format("Неизвестный тип адреса '{}' (ожидается p2pk, p2sh или p2s)", type)
    );
}

int run_decode(const ergo::address::AddressEncoder& encoder,
               const ergo::log::ConsoleLog& console,
               std::string_view text) {
    using namespace ergo;

    auto decoded = encoder.decode(text);
    if (!decoded) {
        console.error(decoded.error().message);
        return EXIT_ADDRESS_ERROR;
    }

    const auto type = address::type_tag(*decoded);
    const auto& content = address::content_bytes(*decoded);

    std::cout << "network: " << address::network_name(encoder.network_prefix()) << "\n"
              << "type:    " << address::type_name(type) << "\n"
              << "content: " << encoding::to_hex(content) << std::endl;
    return 0;
}

int run_encode(const ergo::address::AddressEncoder& encoder,
               const ergo::log::ConsoleLog& console,
               std::string_view type,
               std::string_view hex) {
    using namespace ergo;

    auto content = encoding::from_hex(hex);
    if (!content) {
        console.error(content.error().message);
        return EXIT_ADDRESS_ERROR;
    }

    auto built = make_address(type, std::move(*content));
    if (!built) {
        console.error(built.error().message);
        return EXIT_ADDRESS_ERROR;
    }

    std::cout << address::to_string(*built, encoder) << std::endl;
    return 0;
}

int run_p2sh_from_script(const ergo::address::AddressEncoder& encoder,
                         const ergo::log::ConsoleLog& console,
                         std::string_view hex) {
    using namespace ergo;

    auto script = encoding::from_hex(hex);
    if (!script) {
        console.error(script.error().message);
        return EXIT_ADDRESS_ERROR;
    }

    const address::Address p2sh = address::Pay2SHAddress::from_script(*script);
    console.debug(std::format("hash192: {}", encoding::to_hex(address::content_bytes(p2sh))));

    std::cout << address::to_string(p2sh, encoder) << std::endl;
    return 0;
}

int run_check_p2pk(const ergo::address::AddressEncoder& encoder,
                   const ergo::log::ConsoleLog& console,
                   std::string_view text) {
    auto decoded = encoder.decode(text);
    if (!decoded) {
        console.info(std::format("Адрес некорректен: {}", decoded.error().message));
        return EXIT_ADDRESS_ERROR;
    }

    const bool p2pk = ergo::address::is_p2pk(*decoded);
    std::cout << (p2pk ? "true" : "false") << std::endl;
    return p2pk ? 0 : EXIT_ADDRESS_ERROR;
}

} // anonymous namespace

/**
 * @brief Главная функция
 */
int main(int argc, char* argv[]) {
    using namespace ergo;

    auto args = parse_args(argc, argv);

    if (args.show_help) {
        print_help();
        return 0;
    }

    if (args.show_version) {
        std::cout << "ergo-address v" << VERSION << std::endl;
        return 0;
    }

    // Загружаем конфигурацию
    auto config_result = Config::load_with_search(args.config_path);
    if (!config_result) {
        std::cerr << "[ERROR] " << config_result.error().message << std::endl;
        return EXIT_CONFIG_ERROR;
    }

    Config config = *config_result;

    if (args.network) {
        auto prefix = address::parse_network(*args.network);
        if (!prefix) {
            std::cerr << "[ERROR] " << prefix.error().message << std::endl;
            return EXIT_CONFIG_ERROR;
        }
        config.network.prefix = *prefix;
    }

    if (args.quiet) {
        config.logging.level = LogLevel::Error;
    }

    const log::ConsoleLog console(config.logging);

    // Валидируем конфигурацию
    auto validation = config.validate();
    if (!validation) {
        console.error(std::format("Ошибка валидации конфигурации: {}", validation.error().message));
        return EXIT_CONFIG_ERROR;
    }

    const address::AddressEncoder encoder(config.network.prefix);
    console.debug(std::format("Сеть: {} (префикс {})",
                          address::network_name(encoder.network_prefix()),
                          static_cast<unsigned>(encoder.network_prefix())));

    const auto& pos = args.positional;
    if (pos.empty()) {
        print_help();
        return EXIT_ADDRESS_ERROR;
    }

    const std::string& command = pos[0];

    if (command == "decode" && pos.size() == 2) {
        return run_decode(encoder, console, pos[1]);
    }
    if (command == "encode" && pos.size() == 3) {
        return run_encode(encoder, console, pos[1], pos[2]);
    }
    if (command == "p2sh-from-script" && pos.size() == 2) {
        return run_p2sh_from_script(encoder, console, pos[1]);
    }
    if (command == "check-p2pk" && pos.size() == 2) {
        return run_check_p2pk(encoder, console, pos[1]);
    }

    console.error(std::format("Неизвестная команда или неверное число аргументов: {}", command));
    return EXIT_ADDRESS_ERROR;
}
