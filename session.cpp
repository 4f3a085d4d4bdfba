#include <sstream>
#include <stdexcept>
#include "session.hpp"
#include "validator.hpp"

using std::string;
using std::vector;
using std::endl;

const char* status_message(Status s) {
    switch (s) {
    case Status::accepted:             return "OK";
    case Status::incomplete_input:     return Validator::message(Validator::Verdict::incomplete);
    case Status::malformed_equation:   return Validator::message(Validator::Verdict::malformed);
    case Status::arithmetic_mismatch:  return Validator::message(Validator::Verdict::arithmetic_mismatch);
    case Status::session_terminal:     return "The game is over, come back tomorrow!";
    case Status::already_played_today: return "You've already played today!";
    case Status::invalid_character:    return "Only digits, + - * / and = are allowed!";
    case Status::row_full:             return "The row is full!";
    case Status::nothing_to_delete:    return "Nothing to delete!";
    }
    return "";
}

std::ostream& operator<<(std::ostream& os, Status s) {
    switch (s) {
    case Status::accepted:             return os << "accepted";
    case Status::incomplete_input:     return os << "incomplete_input";
    case Status::malformed_equation:   return os << "malformed_equation";
    case Status::arithmetic_mismatch:  return os << "arithmetic_mismatch";
    case Status::session_terminal:     return os << "session_terminal";
    case Status::already_played_today: return os << "already_played_today";
    case Status::invalid_character:    return os << "invalid_character";
    case Status::row_full:             return os << "row_full";
    case Status::nothing_to_delete:    return os << "nothing_to_delete";
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, Session::State s) {
    switch (s) {
    case Session::State::in_progress: return os << "in_progress";
    case Session::State::won:         return os << "won";
    case Session::State::lost:        return os << "lost";
    }
    return os;
}

const int Session::max_guesses;

Session::Session(const Equation& answer_) : answer(answer_), row(0), column(0) {
    if (!answer.is_complete()) {
        throw std::runtime_error("Session answer has blanks: '" + answer.to_string() + "'");
    }
}

Session::State Session::get_state() const {
    if (row > 0 && guesses[row - 1].is_all_correct()) return State::won;
    if (row >= max_guesses) return State::lost;
    return State::in_progress;
}

bool Session::is_terminal() const { return get_state() != State::in_progress; }
int Session::get_row() const { return row; }
int Session::get_column() const { return column; }
int Session::tries_used() const { return row; }
const Session::Guesses& Session::get_guesses() const { return guesses; }
const Feedback::KeyFeedback& Session::get_key_feedback() const { return keys; }
const Equation& Session::get_answer() const { return answer; }

Status Session::insert_character(char c) {
    if (is_terminal()) return Status::session_terminal;
    if (!Equation::is_symbol(c)) return Status::invalid_character;
    if (column >= Equation::length) return Status::row_full;
    guesses[row].set_char(column, c);
    column++;
    return Status::accepted;
}

Status Session::delete_character() {
    if (is_terminal()) return Status::session_terminal;
    if (column == 0) return Status::nothing_to_delete;
    column--;
    guesses[row].set_char(column, Equation::blank);
    return Status::accepted;
}

Status Session::submit_guess() {
    if (is_terminal()) return Status::session_terminal;
    if (column < Equation::length) return Status::incomplete_input;

    Guess& g = guesses[row];
    switch (Validator::check(g.get_equation())) {
    case Validator::Verdict::valid:
        break;
    case Validator::Verdict::incomplete:
        return Status::incomplete_input;
    case Validator::Verdict::malformed:
        return Status::malformed_equation;
    case Validator::Verdict::arithmetic_mismatch:
        return Status::arithmetic_mismatch;
    }

    g.finalize(Feedback::score(answer, g.get_equation()));
    Feedback::update_keys(keys, g);
    row++;
    column = 0;
    return Status::accepted;
}

bool Session::restore(const vector<Guess>& saved, int row_, int column_, const Feedback::KeyFeedback& keys_) {
    if (saved.size() != static_cast<size_t>(max_guesses)) return false;
    if (row_ < 0 || row_ > max_guesses || column_ < 0 || column_ > Equation::length) return false;
    if (row_ == max_guesses && column_ != 0) return false;

    Feedback::KeyFeedback rebuilt;
    for (int i = 0; i < row_; i++) {
        const Guess& g = saved[i];
        if (!g.is_finalized()) return false;
        // nothing can follow a winning row
        if (i < row_ - 1 && g.is_all_correct()) return false;
        if (!(Guess(answer, g.get_equation()) == g)) return false;
        Feedback::update_keys(rebuilt, g);
    }
    bool won = row_ > 0 && saved[row_ - 1].is_all_correct();
    if (won && column_ != 0) return false;

    for (int i = row_; i < max_guesses; i++) {
        const Guess& g = saved[i];
        if (g.is_finalized()) return false;
        int typed = (i == row_) ? column_ : 0;
        for (int j = 0; j < Equation::length; j++) {
            if ((g.get_char(j) != Equation::blank) != (j < typed)) return false;
        }
    }
    if (rebuilt != keys_) return false;

    for (int i = 0; i < max_guesses; i++) {
        guesses[i] = saved[i];
    }
    row = row_;
    column = column_;
    keys = rebuilt;
    return true;
}

string Session::guesses_to_string(const Guesses& g) {
    string s;
    for (int i = 0; i < max_guesses; i++) {
        if (i > 0) s += '|';
        s += g[i].to_string();
    }
    return s;
}

vector<Guess> Session::guesses_of_string(const string& s) {
    vector<Guess> result;
    std::stringstream ss(s);
    string g;
    while (std::getline(ss, g, '|')) {
        result.push_back(Guess(g));
    }
    if (result.size() != static_cast<size_t>(max_guesses)) {
        throw std::runtime_error("Expected " + std::to_string(max_guesses) + " saved guesses, got " + std::to_string(result.size()));
    }
    return result;
}

// types [s] into the session, stops at the first rejection
static Status type(Session& session, const string& s) {
    for (char c : s) {
        Status st = session.insert_character(c);
        if (st != Status::accepted) return st;
    }
    return Status::accepted;
}

static void clear_row(Session& session) {
    while (session.delete_character() == Status::accepted) {}
}

void Session::test() {
    std::stringstream output1;
    std::stringstream expected1;
    Status st;

    // one guess, all correct
    Session a(Equation("12+57=69"));
    output1 << type(a, "12+57=69") << " ";
    st = a.submit_guess();
    output1 << st << " " << a.get_state() << " " << a.tries_used() << " "
            << a.get_guesses()[0].to_string() << " ";
    output1 << a.insert_character('1') << " ";
    output1 << a.delete_character() << " ";
    output1 << a.submit_guess() << endl;

    // repeated digits: answer 10+10=20, guess 01+19=20
    Session b(Equation("10+10=20"));
    type(b, "01+19=20");
    st = b.submit_guess();
    output1 << st << " " << b.get_guesses()[0].to_string() << " "
            << Feedback::to_string(b.get_key_feedback()) << endl;

    // rejections leave the row alone and don't use a turn
    Session c(Equation("10+10=20"));
    output1 << type(c, "12+5") << " ";
    output1 << c.submit_guess() << " " << c.get_row() << c.get_column()
            << " [" << c.get_guesses()[0].get_equation() << "]" << endl;
    output1 << type(c, "x") << " ";
    output1 << type(c, " ") << " ";
    output1 << type(c, "7=6") << " ";
    output1 << c.submit_guess() << " ";
    output1 << c.insert_character('9') << " ";
    output1 << c.insert_character('1') << " " << c.get_row() << c.get_column()
            << " [" << c.get_guesses()[0].get_equation() << "]" << endl;
    clear_row(c);
    output1 << c.delete_character() << " ";
    output1 << type(c, "10+10=21") << " ";
    output1 << c.submit_guess() << " " << c.get_guesses()[0].to_string() << " "
            << c.get_key_feedback().size() << endl;
    clear_row(c);
    output1 << type(c, "1+1==222") << " ";
    output1 << c.submit_guess() << " " << c.get_row() << c.get_column() << " " << c.get_state() << endl;

    expected1 << "accepted accepted won 1 12+57=69 ........ session_terminal session_terminal session_terminal" << endl;
    expected1 << "accepted 01+19=20 ~~.._... +.0.1.2.9_=." << endl;
    expected1 << "accepted incomplete_input 04 [12+5    ]" << endl;
    expected1 << "invalid_character invalid_character accepted incomplete_input accepted row_full 08 [12+57=69]" << endl;
    expected1 << "nothing_to_delete accepted arithmetic_mismatch 10+10=21 ???????? 0" << endl;
    expected1 << "accepted malformed_equation 08 in_progress" << endl;

    string output1_str = output1.str();
    string expected1_str = expected1.str();
    if (output1_str != expected1_str) {
        throw std::runtime_error("Session::test() 1 failed, got\n" + output1_str + ", but expected\n" + expected1_str);
    }

    // six valid misses
    std::stringstream output2;
    std::stringstream expected2;
    Session e(Equation("12+57=69"));
    const char* misses[] = { "10+10=20", "50-10=40", "10+2-3=9", "18/2*1=9", "99-90=09", "11+11=22" };
    for (const char* m : misses) {
        Feedback::KeyFeedback before = e.get_key_feedback();
        type(e, m);
        st = e.submit_guess();
        output2 << st << " " << e.get_guesses()[e.get_row() - 1].to_string() << endl;
        for (const auto& kv : before) {
            if (e.get_key_feedback().at(kv.first) < kv.second) {
                throw std::runtime_error(string("Session::test() 2 failed, key downgraded: ") + kv.first);
            }
        }
    }
    output2 << e.get_state() << " " << e.tries_used() << " " << e.is_terminal() << " "
            << Feedback::to_string(e.get_key_feedback()) << " ";
    output2 << e.insert_character('1') << " ";
    output2 << e.submit_guess() << endl;

    expected2 << "accepted 10+10=20 ._.__.~_" << endl;
    expected2 << "accepted 50-10=40 ~__~_.__" << endl;
    expected2 << "accepted 10+2-3=9 ._.~__~." << endl;
    expected2 << "accepted 18/2*1=9 .__~__~." << endl;
    expected2 << "accepted 99-90=09 _____._." << endl;
    expected2 << "accepted 11+11=22 ._.__.~_" << endl;
    expected2 << "lost 6 1 *_+.-_/_0_1.2~3_4_5~8_9.=. session_terminal session_terminal" << endl;

    string output2_str = output2.str();
    string expected2_str = expected2.str();
    if (output2_str != expected2_str) {
        throw std::runtime_error("Session::test() 2 failed, got\n" + output2_str + ", but expected\n" + expected2_str);
    }

    // restore
    std::stringstream output3;
    std::stringstream expected3;
    Session s(Equation("12+57=69"));
    type(s, "10+10=20");
    s.submit_guess();
    type(s, "50");
    string text = guesses_to_string(s.get_guesses());
    vector<Guess> saved = guesses_of_string(text);

    Session r(Equation("12+57=69"));
    bool ok = r.restore(saved, 1, 2, s.get_key_feedback());
    output3 << ok << " " << r.get_row() << r.get_column() << " "
            << (guesses_to_string(r.get_guesses()) == text) << " ";
    output3 << type(r, "-10=40") << " ";
    st = r.submit_guess();
    output3 << st << " " << r.get_row() << endl;

    Session fresh(Equation("12+57=69"));
    vector<Guess> tampered = saved;
    tampered[0] = Guess("10+10=20 ........");
    vector<Guess> short_list(saved.begin(), saved.begin() + 5);
    output3 << fresh.restore(saved, 1, 3, s.get_key_feedback())
            << fresh.restore(saved, 2, 0, s.get_key_feedback())
            << fresh.restore(saved, 0, 0, Feedback::KeyFeedback())
            << fresh.restore(tampered, 1, 2, s.get_key_feedback())
            << fresh.restore(saved, 1, 2, Feedback::KeyFeedback())
            << fresh.restore(short_list, 1, 2, s.get_key_feedback())
            << fresh.restore(saved, -1, 2, s.get_key_feedback())
            << fresh.restore(saved, 1, 9, s.get_key_feedback()) << " "
            << fresh.get_row() << fresh.get_column() << " "
            << fresh.get_guesses()[0].to_string() << endl;

    // a finished game comes back finished
    vector<Guess> won_rows(a.get_guesses().begin(), a.get_guesses().end());
    Session w(Equation("12+57=69"));
    ok = w.restore(won_rows, 1, 0, a.get_key_feedback());
    output3 << ok << " " << w.get_state() << " ";
    ok = w.restore(won_rows, 1, 1, a.get_key_feedback());
    output3 << ok << endl;

    expected3 << "1 12 1 accepted accepted 2" << endl;
    expected3 << "00000000 00 " << string(Equation::length + 1, ' ') << "????????" << endl;
    expected3 << "1 won 0" << endl;

    string output3_str = output3.str();
    string expected3_str = expected3.str();
    if (output3_str != expected3_str) {
        throw std::runtime_error("Session::test() 3 failed, got\n" + output3_str + ", but expected\n" + expected3_str);
    }

    int rejected = 0;
    const char* bad[] = { "", "12+57=69 ........", "a|b|c|d|e|f" };
    for (const char* t : bad) {
        try {
            guesses_of_string(t);
        } catch (const std::runtime_error&) {
            rejected++;
        }
    }
    if (rejected != 3) {
        throw std::runtime_error("Session::test() 4 failed, only rejected " + std::to_string(rejected) + " of 3");
    }
}
