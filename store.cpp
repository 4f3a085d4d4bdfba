#include <fstream>
#include <sstream>
#include <cstdio>
#include <cstdint>
#include <stdexcept>
#include <boost/lexical_cast.hpp>
#include "store.hpp"

using std::string;
using std::map;
using std::cerr;
using std::endl;
using boost::posix_time::ptime;
using boost::posix_time::microsec_clock;

namespace Store {
    bool silence = false;

    //////////////////
    // Batch

    void Batch::set(const string& key, const string& value) {
        if (key.empty() || key.find_first_of("=\n") != string::npos) {
            throw std::runtime_error("Bad store key: '" + key + "'");
        }
        if (value.find('\n') != string::npos) {
            throw std::runtime_error("Store value for " + key + " contains a newline");
        }
        changes.push_back({ key, value, false });
    }
    void Batch::set(const string& key, int value) { set(key, boost::lexical_cast<string>(value)); }
    void Batch::set(const string& key, Calendar::Day value) { set(key, Calendar::to_string(value)); }
    void Batch::remove(const string& key) { changes.push_back({ key, string(), true }); }
    bool Batch::empty() const { return changes.empty(); }
    const std::vector<Batch::Change>& Batch::get_changes() const { return changes; }

    void apply_changes(const Batch& b, map<string, string>& data) {
        for (const Batch::Change& c : b.get_changes()) {
            if (c.erase) {
                data.erase(c.key);
            } else {
                data[c.key] = c.value;
            }
        }
    }

    //////////////////
    // Store_intf

    void Store_intf::set(const string& key, const string& value) {
        Batch b;
        b.set(key, value);
        apply(b);
    }

    void Store_intf::remove(const string& key) {
        Batch b;
        b.remove(key);
        apply(b);
    }

    bool Store_intf::has(const string& key) const {
        string ignored;
        return get(key, ignored);
    }

    bool Store_intf::get_int(const string& key, int& value) const {
        string s;
        if (!get(key, s)) return false;
        try {
            value = boost::lexical_cast<int>(s);
        } catch (const boost::bad_lexical_cast&) {
            if (!silence) cerr << "Ignoring unreadable " << key << ": '" << s << "'" << endl;
            return false;
        }
        return true;
    }

    bool Store_intf::get_day(const string& key, Calendar::Day& value) const {
        string s;
        if (!get(key, s)) return false;
        try {
            value = Calendar::day_of_string(s);
        } catch (const std::runtime_error& e) {
            if (!silence) cerr << "Ignoring unreadable " << key << ": " << e.what() << endl;
            return false;
        }
        return true;
    }

    //////////////////
    // Memory_store

    bool Memory_store::get(const string& key, string& value) const {
        auto it = data.find(key);
        if (it == data.end()) return false;
        value = it->second;
        return true;
    }

    void Memory_store::apply(const Batch& b) {
        apply_changes(b, data);
    }

    size_t Memory_store::size() const { return data.size(); }

    //////////////////
    // File_store

    File_store::File_store(const string& filename_) : filename(filename_) {
        load_from_file();
    }

    void File_store::load_from_file() {
        ptime start = microsec_clock::local_time();
        std::ifstream ifs(filename);
        if (!ifs.is_open()) {
            if (!silence) cerr << "No store at " << filename << ", starting fresh" << endl;
            return;
        }

        string line;
        int line_number = 0;
        uint64_t count = 0;
        while (std::getline(ifs, line)) {
            line_number++;
            if (line.empty()) continue;
            size_t eq = line.find('=');
            if (eq == string::npos || eq == 0) {
                if (!silence) cerr << "Skipping bad line " << line_number << " in store " << filename << endl;
                continue;
            }
            data[line.substr(0, eq)] = line.substr(eq + 1);
            count++;
        }
        if (!silence) {
            cerr << "Read " << count << " records from store: " << filename
                 << ", took " << (microsec_clock::local_time() - start).total_microseconds() / 1e6 << "s" << endl;
        }
    }

    void File_store::write_file(const map<string, string>& contents) const {
        string tmpfile = filename + ".tmp";
        {
            std::ofstream output_file(tmpfile, std::ios::trunc);
            if (!output_file.is_open()) {
                throw std::runtime_error("Can't open " + tmpfile + " for writing");
            }
            for (const auto& kv : contents) {
                output_file << kv.first << '=' << kv.second << '\n';
            }
            output_file.flush();
            if (!output_file.good()) {
                output_file.close();
                std::remove(tmpfile.c_str());
                throw std::runtime_error("Failed writing " + tmpfile);
            }
        }
        if (std::rename(tmpfile.c_str(), filename.c_str()) != 0) {
            std::remove(tmpfile.c_str());
            throw std::runtime_error("Can't move " + tmpfile + " over " + filename);
        }
    }

    bool File_store::get(const string& key, string& value) const {
        auto it = data.find(key);
        if (it == data.end()) return false;
        value = it->second;
        return true;
    }

    void File_store::apply(const Batch& b) {
        if (b.empty()) return;
        map<string, string> next = data;
        apply_changes(b, next);
        write_file(next);
        data.swap(next);
    }

    size_t File_store::size() const { return data.size(); }

    void test() {
        Silencer quiet(silence);
        string tmpfile = "/tmp/tmp.eqle.store";
        std::remove(tmpfile.c_str());

        std::stringstream output1;
        std::stringstream expected1;
        string s;
        int n = -1;
        Calendar::Day d;

        {
            File_store fs(tmpfile);
            bool found = fs.get(Keys::daily_equation, s);
            output1 << fs.size() << " " << found << " [" << s << "]" << endl;

            Batch b;
            b.set(Keys::daily_equation, "12+57=69");
            b.set(Keys::current_streak, 4);
            b.set(Keys::last_win_date, Calendar::day_of_string("2024-03-01"));
            b.set(Keys::saved_guesses, "a=b|c");
            fs.apply(b);
            fs.remove(Keys::saved_guesses);
            fs.set(Keys::total_won, "lots");

            found = fs.get(Keys::daily_equation, s);
            output1 << fs.size() << " " << found << " [" << s << "] ";
            found = fs.get_int(Keys::current_streak, n);
            output1 << found << " " << n << " ";
            found = fs.get_int(Keys::total_won, n);
            output1 << found << " " << n << " ";
            found = fs.get_int(Keys::best_streak, n);
            output1 << found << " " << n << " ";
            found = fs.get_day(Keys::last_win_date, d);
            output1 << found << " " << Calendar::to_string(d) << " ";
            output1 << fs.get_day(Keys::daily_equation, d) << " "
                    << fs.has(Keys::saved_guesses) << endl;
        }

        // a second instance sees the same thing, bad lines are skipped
        {
            std::ofstream append(tmpfile, std::ios::app);
            append << "no equals sign here" << endl << "=empty key" << endl << endl;
        }
        {
            File_store fs(tmpfile);
            bool found = fs.get(Keys::daily_equation, s);
            output1 << fs.size() << " " << found << " [" << s << "] ";
            found = fs.get_int(Keys::current_streak, n);
            output1 << found << " " << n << endl;
        }

        expected1 << "0 0 []" << endl;
        expected1 << "4 1 [12+57=69] 1 4 0 4 0 4 1 2024-03-01 0 0" << endl;
        expected1 << "4 1 [12+57=69] 1 4" << endl;

        std::remove(tmpfile.c_str());
        string output1_str = output1.str();
        string expected1_str = expected1.str();
        if (output1_str != expected1_str) {
            throw std::runtime_error("Store::test() 1 failed, got\n" + output1_str + ", but expected\n" + expected1_str);
        }

        // bad writes are refused before anything changes
        Memory_store ms;
        ms.set("a", "1");
        int rejected = 0;
        try {
            Batch b;
            b.set("b", "2");
            b.set("c", "two\nlines");
            ms.apply(b);
        } catch (const std::runtime_error&) {
            rejected++;
        }
        try {
            ms.set("x=y", "1");
        } catch (const std::runtime_error&) {
            rejected++;
        }
        try {
            ms.set("", "1");
        } catch (const std::runtime_error&) {
            rejected++;
        }
        if (rejected != 3 || ms.size() != 1 || ms.has("b")) {
            throw std::runtime_error("Store::test() 2 failed, rejected " + std::to_string(rejected) + " with " + std::to_string(ms.size()) + " keys");
        }

        // a store whose file can't be written keeps its old contents
        File_store unwritable("/nonexistent-directory/eqle.store");
        try {
            unwritable.set("a", "1");
        } catch (const std::runtime_error&) {
            rejected++;
        }
        if (rejected != 4 || unwritable.size() != 0) {
            throw std::runtime_error("Store::test() 3 failed, write to a missing directory was accepted");
        }

        // the flag comes back even when the code in between throws
        bool flag = false;
        try {
            Silencer inner(flag);
            if (!flag) throw std::runtime_error("Store::test() 4 failed, flag not set");
            throw std::runtime_error("unwind");
        } catch (const std::runtime_error& e) {
            if (string(e.what()) != "unwind") throw;
        }
        {
            Silencer outer(flag);
            { Silencer inner(flag); }
            if (!flag) throw std::runtime_error("Store::test() 4 failed, nested guard cleared the flag");
        }
        if (flag || !silence) {
            throw std::runtime_error("Store::test() 4 failed, flags not restored");
        }
    }
}
