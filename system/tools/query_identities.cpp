// ============= tools/query_identities.cpp =============
/*
 * Herramienta de consulta para la DB de autoface
 *
 * EJEMPLOS DE USO:
 * ./query_identities database/autoface.db --stats
 * ./query_identities database/autoface.db --recent 10
 * ./query_identities database/autoface.db --persons
 * ./query_identities database/autoface.db --persons --export persons.csv
 */

#include "core/errors.hpp"
#include "database/face_store.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace autoface;

namespace {

std::string age_text(const std::optional<int>& age) {
    return age ? std::to_string(*age) : "-";
}

std::string confidence_text(const std::optional<float>& confidence) {
    if (!confidence) return "first";
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(3) << *confidence;
    return ss.str();
}

std::string average_text(const std::optional<double>& avg) {
    if (!avg) return "-";
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(3) << *avg;
    return ss.str();
}

std::string or_dash(const std::string& s) {
    return s.empty() ? "-" : s;
}

} // namespace

class IdentityQueryTool {
public:
    explicit IdentityQueryTool(const std::string& path) : store(path) {}

    void show_statistics() {
        auto stats = store.stats(system_clock_ms());

        std::cout << "\n═══════════════════════════════════════════════" << std::endl;
        std::cout << "   ESTADÍSTICAS GENERALES" << std::endl;
        std::cout << "═══════════════════════════════════════════════" << std::endl;
        std::cout << "Identidades:         " << stats.total_identities << std::endl;
        std::cout << "Detecciones:         " << stats.total_detections << std::endl;
        std::cout << "Duplicados exactos:  " << stats.total_exact_duplicates << std::endl;
        std::cout << "Últimas 24h:         " << stats.detections_last_24h << std::endl;
        if (!stats.most_seen_code.empty()) {
            std::cout << "Más visto:           " << stats.most_seen_code
                      << " (" << stats.most_seen_count << ")" << std::endl;
        }
        std::cout << "═══════════════════════════════════════════════\n" << std::endl;
    }

    std::vector<DetectionEvent> recent(int limit) {
        return store.recent_detections(limit);
    }

    std::vector<Identity> persons() {
        return store.list_identities();
    }

    void print_events(const std::vector<DetectionEvent>& events) {
        if (events.empty()) {
            std::cout << "No se encontraron detecciones." << std::endl;
            return;
        }

        std::cout << "\nÚltimas " << events.size() << " detecciones:\n" << std::endl;
        std::cout << std::left
                  << std::setw(8) << "Event"
                  << std::setw(10) << "Identity"
                  << std::setw(22) << "Timestamp"
                  << std::setw(8) << "Conf"
                  << std::setw(5) << "Age"
                  << std::setw(10) << "Gender"
                  << std::setw(12) << "Emotion"
                  << std::endl;
        std::cout << std::string(75, '-') << std::endl;

        for (const auto& e : events) {
            std::cout << std::left
                      << std::setw(8) << e.event_id
                      << std::setw(10) << e.identity_id
                      << std::setw(22) << format_timestamp(e.timestamp)
                      << std::setw(8) << confidence_text(e.confidence)
                      << std::setw(5) << age_text(e.attributes.age)
                      << std::setw(10) << or_dash(e.attributes.gender.dominant)
                      << std::setw(12) << or_dash(e.attributes.emotion.dominant)
                      << std::endl;
        }
    }

    void print_persons(const std::vector<Identity>& identities) {
        if (identities.empty()) {
            std::cout << "No hay personas registradas." << std::endl;
            return;
        }

        std::cout << "\n" << identities.size() << " personas:\n" << std::endl;
        std::cout << std::left
                  << std::setw(28) << "Code"
                  << std::setw(22) << "First seen"
                  << std::setw(22) << "Last seen"
                  << std::setw(6) << "Dets"
                  << std::setw(8) << "Avg"
                  << std::endl;
        std::cout << std::string(86, '-') << std::endl;

        for (const auto& p : identities) {
            std::cout << std::left
                      << std::setw(28) << p.display_code
                      << std::setw(22) << format_timestamp(p.first_seen)
                      << std::setw(22) << format_timestamp(p.last_seen)
                      << std::setw(6) << p.total_detections
                      << std::setw(8) << average_text(p.confidence_running_average)
                      << std::endl;
        }
    }

    bool export_events(const std::vector<DetectionEvent>& events, const std::string& filename) {
        std::ofstream file(filename);
        if (!file.is_open()) {
            std::cerr << "Error abriendo archivo: " << filename << std::endl;
            return false;
        }

        file << "event_id,identity_id,timestamp,confidence,fingerprint,age,gender,emotion,ethnicity\n";
        for (const auto& e : events) {
            file << e.event_id << ","
                 << e.identity_id << ","
                 << format_timestamp(e.timestamp) << ","
                 << (e.confidence ? confidence_text(e.confidence) : "") << ","
                 << e.content_fingerprint << ","
                 << (e.attributes.age ? std::to_string(*e.attributes.age) : "") << ","
                 << e.attributes.gender.dominant << ","
                 << e.attributes.emotion.dominant << ","
                 << e.attributes.ethnicity.dominant << "\n";
        }

        std::cout << "Exportado a: " << filename << std::endl;
        return true;
    }

    bool export_persons(const std::vector<Identity>& identities, const std::string& filename) {
        std::ofstream file(filename);
        if (!file.is_open()) {
            std::cerr << "Error abriendo archivo: " << filename << std::endl;
            return false;
        }

        file << "identity_id,display_code,first_seen,last_seen,total_detections,average_confidence,age,gender\n";
        for (const auto& p : identities) {
            file << p.identity_id << ","
                 << p.display_code << ","
                 << format_timestamp(p.first_seen) << ","
                 << format_timestamp(p.last_seen) << ","
                 << p.total_detections << ","
                 << (p.confidence_running_average ? average_text(p.confidence_running_average) : "") << ","
                 << (p.age_estimate ? std::to_string(*p.age_estimate) : "") << ","
                 << p.gender_estimate << "\n";
        }

        std::cout << "Exportado a: " << filename << std::endl;
        return true;
    }

private:
    FaceStore store;
};

void print_usage(const char* prog) {
    std::cout << "USO: " << prog << " <autoface.db> [opciones]\n\n";
    std::cout << "OPCIONES:\n";
    std::cout << "  --stats                     Mostrar estadísticas generales\n";
    std::cout << "  --recent N                  Mostrar últimas N detecciones (default 20)\n";
    std::cout << "  --persons                   Listar personas (last_seen DESC)\n";
    std::cout << "  --export FILENAME.csv       Exportar resultados a CSV\n";
    std::cout << "\nEJEMPLOS:\n";
    std::cout << "  " << prog << " autoface.db --stats\n";
    std::cout << "  " << prog << " autoface.db --recent 50 --export recent.csv\n";
    std::cout << "  " << prog << " autoface.db --persons\n";
}

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::warn);

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string db_path = argv[1];
    if (!std::filesystem::exists(db_path)) {
        std::cerr << "No existe: " << db_path << std::endl;
        return 1;
    }

    bool stats_only = false;
    bool list_persons = false;
    int limit = 20;
    std::string export_file;

    try {
        for (int i = 2; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--stats") {
                stats_only = true;
            }
            else if (arg == "--recent" && i + 1 < argc) {
                limit = std::stoi(argv[++i]);
            }
            else if (arg == "--persons") {
                list_persons = true;
            }
            else if (arg == "--export" && i + 1 < argc) {
                export_file = argv[++i];
            }
            else {
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::logic_error&) {
        std::cerr << "Argumento numérico inválido" << std::endl;
        return 1;
    }

    try {
        IdentityQueryTool tool(db_path);

        if (stats_only) {
            tool.show_statistics();
            return 0;
        }

        if (list_persons) {
            auto identities = tool.persons();
            tool.print_persons(identities);
            if (!export_file.empty() && !tool.export_persons(identities, export_file)) {
                return 1;
            }
            return 0;
        }

        auto events = tool.recent(limit);
        tool.print_events(events);
        if (!export_file.empty() && !tool.export_events(events, export_file)) {
            return 1;
        }

    } catch (const Error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
