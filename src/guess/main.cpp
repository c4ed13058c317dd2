#include <algorithm>
#include <cstdint>
#include <iostream>
#include <random>
#include <string>
#include <vector>
#include <omp.h>
#include <boost/program_options.hpp>
#include <boost/format.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include "guesslib/candidate_space.h"
#include "guesslib/errors.h"
#include "guesslib/guess_game.h"
#include "guesslib/hand.h"
#include "util/partial_shuffle.h"
#include "util/version.h"

namespace
{
    void print_invalid_answer()
    {
        std::cout << "Invalid answer:  input must be a string of one or more\n"
            << "distinct cards separated by whitespace, where each card\n"
            << "is a single character rank 2-9, T, J, Q, K or A, followed\n"
            << "by a single character suit C, D, H, or S.\n";
    }

    enum play_result { PLAYED, INVALID_ANSWER, INVALID_GUESS };

    play_result play_answer(guess_game& game, const std::string& line)
    {
        hand_t answer;

        try
        {
            answer = string_to_hand(line);
        }
        catch (const invalid_selection& e)
        {
            BOOST_LOG_TRIVIAL(debug) << e.what();
            print_invalid_answer();
            return INVALID_ANSWER;
        }

        if (!is_valid_selection(answer))
        {
            print_invalid_answer();
            return INVALID_ANSWER;
        }

        try
        {
            const int guesses = game.play(answer);
            std::cout << "You got it in " << guesses << " guesses!\n";
        }
        catch (const invalid_selection& e)
        {
            BOOST_LOG_TRIVIAL(error) << e.what();
            std::cout << "Invalid guess\n";
            return INVALID_GUESS;
        }
        catch (const hand_size_mismatch& e)
        {
            BOOST_LOG_TRIVIAL(error) << e.what();
            std::cout << "Invalid guess\n";
            return INVALID_GUESS;
        }

        return PLAYED;
    }

    int run_interactive(guess_game& game)
    {
        std::cout << "- Welcome to the Card Guessing Game!\n";
        std::cout << "- Enter the cards (answer) in the format \"4C 3H\"\n";
        std::cout << "- Type 'exit' if you wish to leave the game\n";

        for (;;)
        {
            std::cout << "- " << std::flush;

            std::string line;

            if (!std::getline(std::cin, line))
                return 0;

            if (line == "exit")
            {
                std::cout << "Exiting the game. Goodbye!\n";
                return 0;
            }

            if (play_answer(game, line) == INVALID_GUESS)
                return 1;
        }
    }

    int run_sample(guess_game& game, const int count, const int size, const std::int64_t seed)
    {
        std::mt19937 engine(static_cast<unsigned long>(seed));
        auto deck = get_deck();
        std::int64_t total = 0;
        int worst = 0;

        for (int i = 0; i < count; ++i)
        {
            partial_shuffle(deck, size, engine);
            const hand_t answer = make_hand(std::vector<int>(deck.end() - size, deck.end()));
            const int guesses = game.play(answer);

            BOOST_LOG_TRIVIAL(info) << boost::format("%d/%d %s: %d guesses") % (i + 1) % count
                % get_hand_string(answer) % guesses;

            total += guesses;
            worst = std::max(worst, guesses);
        }

        std::cout << boost::format("Games: %d average: %.3f worst: %d\n")
            % count % (count > 0 ? double(total) / count : 0.0) % worst;

        return 0;
    }
}

int main(int argc, char* argv[])
{
    try
    {
        namespace log = boost::log;

        log::add_common_attributes();

        static const char* log_format = "[%TimeStamp%] %Message%";

        log::add_console_log
        (
            std::clog,
            log::keywords::format = log_format
        );

        namespace po = boost::program_options;

        std::string answer;
        int sample;
        int size;
        std::int64_t seed;
        int threads;
        int max_guesses;
        std::string log_file;
        log::trivial::severity_level log_level;

        po::options_description desc("Options");
        desc.add_options()
            ("help", "produce help message")
            ("answer", po::value<std::string>(&answer), "play a single answer, e.g. \"4C 3H\"")
            ("sample", po::value<int>(&sample)->default_value(0), "play this many random answers")
            ("size", po::value<int>(&size)->default_value(2), "hand size for random answers")
            ("seed", po::value<std::int64_t>(&seed)->default_value(std::random_device()()), "random seed")
            ("threads", po::value<int>(&threads)->default_value(omp_get_max_threads()), "number of threads")
            ("max-guesses", po::value<int>(&max_guesses)->default_value(0), "guess limit per game (0 = none)")
            ("log-file", po::value<std::string>(&log_file), "log file")
            ("log-level", po::value<log::trivial::severity_level>(&log_level)->default_value(log::trivial::warning),
                "minimum log severity")
            ;

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help"))
        {
            std::cout << desc << "\n";
            return 1;
        }

        po::notify(vm);

        log::core::get()->set_filter(log::trivial::severity >= log_level);

        if (!log_file.empty())
        {
            log::add_file_log
            (
                log::keywords::file_name = log_file,
                log::keywords::auto_flush = true,
                log::keywords::format = log_format
            );
        }

        BOOST_LOG_TRIVIAL(info) << "guess " << util::VERSION;
        BOOST_LOG_TRIVIAL(info) << "Using threads: " << threads;

        omp_set_num_threads(threads);

        guess_game game;
        game.set_max_guesses(max_guesses);

        if (sample > 0)
        {
            if (!is_valid_hand_size(size))
                throw invalid_hand_size(size);

            BOOST_LOG_TRIVIAL(info) << "Using random seed: " << seed;
            return run_sample(game, sample, size, seed);
        }

        game.set_transcript(&std::cout);

        if (vm.count("answer"))
            return play_answer(game, answer) == PLAYED ? 0 : 1;

        return run_interactive(game);
    }
    catch (const std::exception& e)
    {
        BOOST_LOG_TRIVIAL(error) << e.what();
        return 1;
    }
}
