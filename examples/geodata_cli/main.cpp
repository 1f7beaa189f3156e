/// Command-line client for the geodata service.
/// Usage: ./geodata_cli <command> [args...]
/// Credentials come from GEODATA_KEY and GEODATA_SECRET; GEODATA_URL overrides
/// the service root.

#include <geodata/geodata.hpp>
#include <cstdlib>
#include <iostream>
#include <string>
#include <type_traits>
#include <vector>

namespace {

void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <command> [args...]\n"
              << "Commands:\n"
              << "  get <layer> <id[,id...]>\n"
              << "  delete <layer> <id>\n"
              << "  nearby <layer> <lat> <lon> [radius_km] [limit]\n"
              << "  history <layer> <id> [limit]\n"
              << "  address <lat> <lon>\n"
              << "  contains <lat> <lon>\n"
              << "  boundary <feature_id>\n"
              << "  density <sun..sat> <hour|-1> <lat> <lon>\n";
}

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

bool parse_weekday(const std::string& code, geodata::Weekday& day) {
    static const geodata::Weekday days[] = {
        geodata::Weekday::Sunday, geodata::Weekday::Monday, geodata::Weekday::Tuesday,
        geodata::Weekday::Wednesday, geodata::Weekday::Thursday, geodata::Weekday::Friday,
        geodata::Weekday::Saturday};
    for (auto d : days) {
        if (geodata::weekday_code(d) == code) {
            day = d;
            return true;
        }
    }
    return false;
}

void print(const geodata::Payload& payload) {
    std::visit([](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            std::cout << "(no content)\n";
        } else if constexpr (std::is_same_v<T, geodata::Record>) {
            std::cout << nlohmann::json(p).dump(2) << "\n";
        } else if constexpr (std::is_same_v<T, std::vector<geodata::Record>>) {
            std::cout << nlohmann::json(p).dump(2) << "\n";
        } else if constexpr (std::is_same_v<T, geodata::GeoDocument>) {
            std::cout << p.json().dump(2) << "\n";
        } else {
            std::cout << p.dump(2) << "\n";
        }
    }, payload);
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    const std::string& command = args[0];

    geodata::GeoClient::Options opts;
    opts.base_url = env_or("GEODATA_URL", std::string(geodata::DEFAULT_BASE_URL));
    opts.consumer_key = env_or("GEODATA_KEY", "");
    opts.consumer_secret = env_or("GEODATA_SECRET", "");
    if (opts.consumer_key.empty() || opts.consumer_secret.empty()) {
        std::cerr << "GEODATA_KEY and GEODATA_SECRET must be set\n";
        return 1;
    }

    try {
        geodata::GeoClient client{std::move(opts)};
        geodata::Payload payload;

        if (command == "get" && args.size() == 3) {
            payload = geodata::resolve(client.retrieve(args[1], args[2], geodata::HandlerType::GeoJson));
        } else if (command == "delete" && args.size() == 3) {
            payload = geodata::resolve(client.remove(args[1], args[2], geodata::HandlerType::Json));
        } else if (command == "nearby" && args.size() >= 4 && args.size() <= 6) {
            double radius = args.size() > 4 ? std::stod(args[4]) : 0.0;
            std::optional<int> limit;
            if (args.size() > 5) limit = std::stoi(args[5]);
            geodata::LatLonNearbyQuery query(std::stod(args[2]), std::stod(args[3]), radius,
                                             args[1], {}, limit);
            // Follow the cursor until the last page
            for (;;) {
                payload = geodata::resolve(client.nearby(query));
                print(payload);
                auto cursor = geodata::next_cursor(payload);
                if (!cursor) break;
                query.set_cursor(cursor);
            }
            return 0;
        } else if (command == "history" && (args.size() == 3 || args.size() == 4)) {
            std::optional<int> limit;
            if (args.size() == 4) limit = std::stoi(args[3]);
            payload = geodata::resolve(client.history(geodata::HistoryQuery(args[2], args[1], limit)));
        } else if (command == "address" && args.size() == 3) {
            payload = geodata::resolve(client.reverse_geocode(std::stod(args[1]), std::stod(args[2])));
        } else if (command == "contains" && args.size() == 3) {
            payload = geodata::resolve(client.contains(std::stod(args[1]), std::stod(args[2])));
        } else if (command == "boundary" && args.size() == 2) {
            payload = geodata::resolve(client.boundary(args[1]));
        } else if (command == "density" && args.size() == 5) {
            geodata::Weekday day;
            if (!parse_weekday(args[1], day)) {
                std::cerr << "Unknown day: " << args[1] << "\n";
                return 1;
            }
            payload = geodata::resolve(client.density(day, std::stoi(args[2]),
                                                      std::stod(args[3]), std::stod(args[4])));
        } else {
            usage(argv[0]);
            return 1;
        }

        print(payload);
    } catch (const geodata::GeoError& e) {
        std::cerr << "Error [" << geodata::error_kind_to_string(e.kind()) << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
