#include <sstream>
#include <stdexcept>
#include "feedback.hpp"
#include "generator.hpp"

using std::string;

namespace Feedback {
    FrequencyTable count_frequencies(const Equation& answer) {
        FrequencyTable counts;
        for (int i = 0; i < Equation::length; i++) {
            if (answer[i] != Equation::blank) counts[answer[i]]++;
        }
        return counts;
    }

    Guess::Tiles score(const Equation& answer, const Equation& guess, FrequencyTable& remaining) {
        Guess::Tiles tiles;
        tiles.fill(Tile::unset);

        for (int i = 0; i < Equation::length; i++) {
            if (guess[i] != Equation::blank && guess[i] == answer[i]) {
                tiles[i] = Tile::correct;
                remaining[guess[i]]--;
            }
        }

        for (int i = 0; i < Equation::length; i++) {
            char c = guess[i];
            if (c == Equation::blank || tiles[i] == Tile::correct) continue;

            auto it = remaining.find(c);
            if (it != remaining.end() && it->second > 0) {
                tiles[i] = Tile::present;
                it->second--;
            } else {
                tiles[i] = Tile::absent;
            }
        }
        return tiles;
    }

    Guess::Tiles score(const Equation& answer, const Equation& guess) {
        FrequencyTable remaining = count_frequencies(answer);
        return score(answer, guess, remaining);
    }

    void update_key(KeyFeedback& keys, char c, Tile t) {
        if (t == Tile::unset) return;
        auto it = keys.find(c);
        if (it == keys.end()) {
            keys[c] = t;
        } else if (it->second < t) {
            it->second = t;
        }
    }

    void update_keys(KeyFeedback& keys, const Guess& g) {
        for (int i = 0; i < Equation::length; i++) {
            update_key(keys, g.get_char(i), g.get_result(i));
        }
    }

    string to_string(const KeyFeedback& keys) {
        string s;
        for (const auto& kv : keys) {
            s += kv.first;
            s += Guess::code_of_tile(kv.second);
        }
        return s;
    }

    KeyFeedback key_feedback_of_string(const string& s) {
        if (s.length() % 2 != 0) {
            throw std::runtime_error("Odd length key feedback: '" + s + "'");
        }
        KeyFeedback keys;
        for (size_t i = 0; i < s.length(); i += 2) {
            if (!Equation::is_symbol(s[i])) {
                throw std::runtime_error("Bad key in key feedback: '" + s + "'");
            }
            Tile t = Guess::tile_of_code(s[i + 1]);
            if (t == Tile::unset || keys.count(s[i])) {
                throw std::runtime_error("Bad entry in key feedback: '" + s + "'");
            }
            keys[s[i]] = t;
        }
        return keys;
    }

    void test() {
        std::stringstream output1;
        std::stringstream expected1;

        FrequencyTable counts = count_frequencies(Equation("10+10=20"));
        for (const auto& kv : counts) output1 << kv.first << kv.second << " ";
        output1 << count_frequencies(Equation("1+1     ")).size() << std::endl;

        // blanks are never marked
        Guess::Tiles partial = score(Equation("12+57=69"), Equation("12+5    "));
        for (Tile t : partial) output1 << t;
        output1 << std::endl;

        // the table passed in is what's consumed
        FrequencyTable remaining = count_frequencies(Equation("10+10=20"));
        score(Equation("10+10=20"), Equation("01+01=20"), remaining);
        output1 << remaining['0'] << remaining['1'] << remaining['='] << std::endl;

        expected1 << "+1 03 12 21 =1 2" << std::endl;
        expected1 << "....????" << std::endl;
        expected1 << "000" << std::endl;

        string output1_str = output1.str();
        string expected1_str = expected1.str();
        if (output1_str != expected1_str) {
            throw std::runtime_error("Feedback::test() 1 failed, got\n" + output1_str + ", but expected\n" + expected1_str);
        }

        // keyboard priority across a session
        std::stringstream output2;
        std::stringstream expected2;
        KeyFeedback keys;
        Equation answer("10+2-3=9");
        update_keys(keys, Guess(answer, Equation("12+3-6=9")));
        output2 << to_string(keys) << std::endl;
        update_keys(keys, Guess(answer, Equation("21+3-6=9")));
        output2 << to_string(keys) << std::endl;
        update_key(keys, '7', Tile::unset);
        update_key(keys, '-', Tile::absent);
        output2 << to_string(keys) << std::endl;
        output2 << (key_feedback_of_string(to_string(keys)) == keys) << std::endl;

        expected2 << "+.-.1.2~3~6_9.=." << std::endl;
        expected2 << "+.-.1.2~3~6_9.=." << std::endl;
        expected2 << "+.-.1.2~3~6_9.=." << std::endl;
        expected2 << 1 << std::endl;

        string output2_str = output2.str();
        string expected2_str = expected2.str();
        if (output2_str != expected2_str) {
            throw std::runtime_error("Feedback::test() 2 failed, got\n" + output2_str + ", but expected\n" + expected2_str);
        }

        int rejected = 0;
        const char* bad[] = { "1.2", "a.", "1x", "1?", "1.1~" };
        for (const char* s : bad) {
            try {
                key_feedback_of_string(s);
            } catch (const std::runtime_error&) {
                rejected++;
            }
        }
        if (rejected != 5) {
            throw std::runtime_error("Feedback::test() 3 failed, only rejected " + std::to_string(rejected) + " of 5 bad inputs");
        }

        // Over many generated answer/guess pairs: correct + present for a character
        // never exceeds its count in the answer, and keyboard feedback never drops.
        Generator::Mt_random_source rng(42);
        for (int round = 0; round < 500; round++) {
            Equation a = Generator::generate(rng);
            KeyFeedback session_keys;
            for (int turn = 0; turn < 6; turn++) {
                Guess g(a, Generator::generate(rng));
                std::map<char, int> marked;
                for (int i = 0; i < Equation::length; i++) {
                    if (g.get_result(i) == Tile::correct || g.get_result(i) == Tile::present) {
                        marked[g.get_char(i)]++;
                    }
                }
                for (const auto& kv : marked) {
                    if (kv.second > a.count(kv.first)) {
                        throw std::runtime_error("Feedback::test() 4 failed, " + g.to_string() + " over-marks against " + a.to_string());
                    }
                }
                KeyFeedback before = session_keys;
                update_keys(session_keys, g);
                for (const auto& kv : before) {
                    if (session_keys.at(kv.first) < kv.second) {
                        throw std::runtime_error("Feedback::test() 5 failed, key feedback downgraded for " + string(1, kv.first));
                    }
                }
            }
        }
    }
}
