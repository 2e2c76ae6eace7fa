// Example: Episode Title Disambiguation
//
// This example runs the episode title rules over file names whose
// episode, season and container matches are already known, and prints
// which spans end up as the series title and the episode title.
//
// To run:
//   ./episode_title_example [matches.json] [config.json]
//
// matches.json holds a serialized match collection:
//   {"input": "...", "matches": [{"start": 0, "end": 3, "name": "season"}]}

#include <episode_title/episode_title.hpp>

#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

using namespace episode_title;

Matches sample(const std::string& input, const std::vector<std::pair<std::string, std::string>>& known) {
    Matches matches(input);
    add_path_markers(matches);
    for (const auto& [name, text] : known) {
        const auto start = input.find(text);
        matches.append(make_match(input, start, start + text.size(), name));
    }
    return matches;
}

void print(const Matches& matches) {
    std::cout << "Input: " << matches.input_string() << "\n";
    std::cout << "------------------------------------------------\n";
    for (const auto& match : matches.all()) {
        std::cout << "  " << match.name << ": " << match.value << " [" << match.start << ", "
                  << match.end << ")\n";
    }
    std::cout << "\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace episode_title;

    try {
        auto config = argc > 2 ? load_config(argv[2]) : default_config();
        auto pipeline = make_pipeline(config);

        std::cout << "Rule order:";
        for (const auto& id : pipeline.order()) {
            std::cout << " " << id;
        }
        std::cout << "\n\n";

        std::vector<Matches> inputs;
        if (argc > 1) {
            std::ifstream file(argv[1]);
            if (!file.is_open()) {
                std::cerr << "Cannot open " << argv[1] << "\n";
                return 1;
            }
            inputs.push_back(nlohmann::json::parse(file).get<Matches>());
        } else {
            inputs.push_back(sample("Show.S01E02.Episode.Name.mkv",
                                    {{"season", "S01"}, {"episodeNumber", "E02"}, {"container", "mkv"}}));
            inputs.push_back(sample("Show Name/Season 1/Show Name S01E02 Pilot.mkv",
                                    {{"season", "Season 1"},
                                     {"episodeNumber", "E02"},
                                     {"container", "mkv"}}));
            inputs.push_back(sample("S01E02 Show - Alt.mkv",
                                    {{"season", "S01"}, {"episodeNumber", "E02"}, {"container", "mkv"}}));
        }

        for (auto& matches : inputs) {
            auto report = pipeline.run(matches);
            print(matches);
            for (const auto& outcome : report.outcomes) {
                if (outcome.fired) {
                    std::cout << "  fired: " << outcome.rule << "\n";
                }
            }
            std::cout << "\n";
        }
    } catch (const EpisodeTitleError& e) {
        std::cerr << "Error (" << to_string(e.code()) << "): " << e.what() << "\n";
        return 1;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Invalid JSON: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
