#include <string>
#include <fstream>
#include <iomanip>
#include <memory>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/program_options.hpp>
#include "calendar.hpp"
#include "engine.hpp"
#include "generator.hpp"
#include "self_test.hpp"
#include "stats.hpp"
#include "store.hpp"

using std::cout;
using std::cerr;
using std::string;
using std::endl;
using boost::posix_time::ptime;
using boost::posix_time::time_duration;
using boost::posix_time::microsec_clock;

namespace po = boost::program_options;

static void print_board(const Engine::Snapshot& s) {
    for (int i = 0; i < Session::max_guesses; i++) {
        cout << "  " << s.guesses[i] << (i == s.row && !s.terminal ? " <" : "") << endl;
    }
    cout << endl << "  ";
    for (char c : string("1234567890+-*/=")) {
        auto it = s.key_feedback.find(c);
        cout << ansi_colour(it == s.key_feedback.end() ? Tile::unset : it->second) << c << ansi_reset << " ";
    }
    cout << endl << endl;
}

static void print_stats(const Stats& s) {
    cout << "Played " << s.total_played
         << "  Win % " << s.win_percentage()
         << "  Current streak " << s.current_streak
         << "  Best streak " << s.best_streak << endl;
    if (s.total_won > 0) cout << "Fewest tries " << s.fewest_tries << endl;
    for (int i = 0; i < Stats::max_tries; i++) {
        cout << "  " << (i + 1) << " " << string(s.win_distribution[i], '#') << " " << s.win_distribution[i] << endl;
    }
}

static void print_countdown(const time_duration& d) {
    cout << "Next puzzle in "
         << std::setfill('0') << std::setw(2) << d.hours() << ":"
         << std::setw(2) << d.minutes() << ":"
         << std::setw(2) << d.seconds() << std::setfill(' ') << endl;
}

static void print_result(Engine& engine) {
    Engine::Snapshot s = engine.current_state();
    if (s.state == Session::State::won) {
        cout << "Solved in " << s.row << (s.row == 1 ? " try!" : " tries!") << endl;
    } else if (s.state == Session::State::lost) {
        cout << "The answer was " << engine.get_answer() << endl;
    }
    print_stats(engine.stats());
    print_countdown(engine.time_until_next_puzzle());
}

int main(int argc, char* argv[]) {
    string opt_store;
    string opt_config;
    string opt_today;
    unsigned int opt_seed = 0;
    bool opt_stats = false;
    bool opt_quiet = false;
    bool opt_self_test = false;

    po::options_description desc("Play today's EQLE puzzle: guess the hidden equation in six tries");
    desc.add_options()
        ("store,s",   po::value<string>(&opt_store)->default_value("eqle.db"),                     "file that progress and stats are kept in, empty to keep nothing")
        ("config,c",  po::value<string>(&opt_config),                                              "read more options from this file, one key=value per line")
        ("seed",      po::value<unsigned int>(&opt_seed),                                          "seed the puzzle generator")
        ("today",     po::value<string>(&opt_today),                                               "play as if it was this day, YYYY-MM-DD")
        ("stats",     po::value<bool>(&opt_stats)->default_value(false)->implicit_value(true),     "print stats and exit")
        ("quiet,q",   po::value<bool>(&opt_quiet)->default_value(false)->implicit_value(true),     "no diagnostics on stderr")
        ("self-test", po::value<bool>(&opt_self_test)->default_value(false)->implicit_value(true), "run the self tests and exit")
        ("help,h",                                                                                 "produce help message");
    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("config")) {
            string filename = vm["config"].as<string>();
            std::ifstream ifs(filename);
            if (!ifs.is_open()) {
                cerr << "Can't open config file: " << filename << endl;
                return 1;
            }
            po::store(po::parse_config_file(ifs, desc), vm);
        }
        po::notify(vm);
    } catch (const po::error& e) {
        cerr << e.what() << endl << desc << endl;
        return 1;
    }
    if (vm.count("help")) {
        cerr << desc << endl;
        return 1;
    }

    if (opt_quiet) {
        Store::silence = true;
        Engine::silence = true;
    }

    if (opt_self_test) {
        try {
            run_all_tests();
        } catch (const std::exception& e) {
            cerr << e.what() << endl;
            return 1;
        }
        cout << "All tests passed." << endl;
        return 0;
    }

    std::shared_ptr<Calendar::Clock> clock_ptr;
    if (opt_today.empty()) {
        clock_ptr = std::make_shared<Calendar::Local_clock>();
    } else {
        try {
            ptime t(Calendar::day_of_string(opt_today), microsec_clock::local_time().time_of_day());
            clock_ptr = std::make_shared<Calendar::Fixed_clock>(t);
        } catch (const std::runtime_error& e) {
            cerr << e.what() << endl;
            return 1;
        }
    }

    std::shared_ptr<Store::Store_intf> store_ptr;
    if (opt_store.empty()) {
        store_ptr = std::make_shared<Store::Memory_store>();
    } else {
        store_ptr = std::make_shared<Store::File_store>(opt_store);
    }

    std::shared_ptr<Generator::Mt_random_source> rng_ptr;
    if (vm.count("seed")) {
        rng_ptr = std::make_shared<Generator::Mt_random_source>(opt_seed);
    } else {
        rng_ptr = std::make_shared<Generator::Mt_random_source>();
    }

    Engine engine(*store_ptr, *clock_ptr, *rng_ptr);

    if (opt_stats) {
        print_stats(engine.stats());
        return 0;
    }

    Status st = engine.start();
    cout << "EQLE " << Calendar::to_string(engine.get_day()) << endl << endl;
    print_board(engine.current_state());
    if (st == Status::already_played_today) {
        cout << status_message(st) << endl;
        print_result(engine);
        return 0;
    }

    cout << "Type an equation and press enter to submit it, '<' deletes, 'q' quits." << endl;
    string line;
    while (!engine.current_state().terminal && std::getline(std::cin, line)) {
        if (line == "q" || line == "quit") break;

        st = Status::accepted;
        for (char c : line) {
            if (c == ' ') continue;
            st = (c == '<') ? engine.delete_character() : engine.insert_character(c);
            if (st != Status::accepted) break;
        }
        if (st == Status::accepted) st = engine.submit_guess();

        print_board(engine.current_state());
        if (st != Status::accepted) cout << status_message(st) << endl;
        if (!engine.persisted()) cout << "(progress could not be saved)" << endl;
    }

    if (engine.current_state().terminal) print_result(engine);
    return 0;
}
