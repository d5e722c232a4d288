/*
seaecho - Acoustic target strength of gas bubbles and solid spheres in seawater
Copyright (C) 2021-2023 The Regents of the University of California
Marine Physical Lab at Scripps Oceanography, c/o Jules Jaffe, jjaffe@ucsd.edu

This program is free software: you can redistribute it and/or modify it under
the terms of the GNU General Public License as published by the Free Software
Foundation, either version 3 of the License, or (at your option) any later
version.

This program is distributed in the hope that it will be useful, but WITHOUT ANY
WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A
PARTICULAR PURPOSE. See the GNU General Public License for more details.

You should have received a copy of the GNU General Public License along with
this program. If not, see <https://www.gnu.org/licenses/>.
*/
#pragma once

#ifndef _SEAECHO_INCLUDING_COMPONENTS_
#error "Must be included from common_setup.hpp!"
#endif

namespace seaecho {

/**
 * Reader for Fortran-style list-directed input, which is the format of the
 * environment file. To use:
 * LDIFile YourFile(internal, "filename");
 * LIST(YourFile); YourFile.Read(somestring); YourFile.Read(somereal); //etc.
 *
 * LIST() starts a new record (a single READ statement). Starting a new record
 * skips the rest of the current line, so anything after the values on a line
 * is a comment. Within a record, values may continue onto following lines
 * unless a '/' ends the record early; reads after the '/' leave the target
 * variable untouched, so it keeps whatever default it had.
 *
 * Items are separated by whitespace or a single comma, may be quoted with ' or
 * ", and may be repeated with the n*value syntax.
 */
class LDIFile {
public:
    LDIFile(seInternal *internal, const std::string &filename)
        : _internal(internal), _filename(filename), codeline(0), line(1),
          repeatcount(0), afterslash(false), atlinestart(true)
    {
        f.open(filename);
    }

    bool Good() { return f.good(); }

#define LIST(ldif) ldif.List(__FILE__, __LINE__)
    void List(const char *file, int fline)
    {
        codefile   = file;
        codeline   = fline;
        afterslash = false;
        if(!atlinestart) SkipRestOfLine();
    }

    void Read(std::string &v)
    {
        std::string s;
        if(NextItem(s)) v = s;
    }
    void Read(char &v)
    {
        std::string s;
        if(!NextItem(s)) return;
        if(s.length() > 1) Error("String " + s + " is not one character");
        v = s.empty() ? ' ' : s[0];
    }
    void Read(int32_t &v)
    {
        std::string s;
        if(!NextItem(s)) return;
        if(!isInt(s, true)) Error("String " + s + " is not an integer");
        v = std::stoi(s);
    }
    void Read(float &v)
    {
        std::string s;
        if(!NextItem(s)) return;
        if(!isReal(s)) Error("String " + s + " is not a real number");
        v = strtof(s.c_str(), nullptr);
    }
    void Read(double &v)
    {
        std::string s;
        if(!NextItem(s)) return;
        if(!isReal(s)) Error("String " + s + " is not a real number");
        v = strtod(s.c_str(), nullptr);
    }
    template<typename REAL> void Read(REAL *arr, size_t count)
    {
        for(size_t i = 0; i < count; ++i) Read(arr[i]);
    }

private:
    [[noreturn]] void Error(const std::string &msg)
    {
        ExternalWarning(
            _internal, "%s:%d reading %s:%d: ", codefile.c_str(), codeline,
            _filename.c_str(), line);
        ExternalError(
            _internal, "%s\nLast token is: \"%s\"", msg.c_str(), lastitem.c_str());
    }

    void SkipRestOfLine()
    {
        int c;
        while((c = f.get()) != EOF && c != '\n') {}
        if(c == EOF) Error("End of file");
        ++line;
        atlinestart = true;
    }

    /**
     * Gets the next item of the current record into s. Returns false for a
     * null item (record ended by '/', or an empty item between two commas),
     * in which case the target variable keeps its value.
     */
    bool NextItem(std::string &s)
    {
        if(repeatcount > 0) {
            --repeatcount;
            s = lastitem;
            return true;
        }
        if(afterslash) return false;
        // Whitespace before the item
        int c;
        while(true) {
            c = f.peek();
            if(c == EOF) Error("End of file");
            if(!isspace(c)) break;
            f.get();
            if(c == '\n') ++line;
        }
        atlinestart = false;
        if(c == ',') {
            f.get();
            return false;
        }
        if(c == '/') {
            f.get();
            afterslash = true;
            return false;
        }
        // The item itself
        lastitem.clear();
        if(c == '\'' || c == '"') {
            int quote = f.get();
            while((c = f.get()) != quote) {
                if(c == EOF || c == '\n') Error("Quotes not closed");
                lastitem += (char)c;
            }
        } else {
            while((c = f.peek()) != EOF && !isspace(c) && c != ',' && c != '/') {
                f.get();
                if(c == '*') {
                    if(repeatcount != 0 || !isInt(lastitem, false))
                        Error("Invalid repetition count");
                    repeatcount = std::stoi(lastitem);
                    if(repeatcount == 0) Error("Repetition count can't be 0");
                    lastitem.clear();
                    continue;
                }
                lastitem += (char)c;
            }
        }
        // One separator after the item: whitespace up to one comma, or a slash
        while((c = f.peek()) != EOF && (c == ' ' || c == '\t' || c == '\r')) f.get();
        if(c == ',') {
            f.get();
        } else if(c == '/') {
            f.get();
            afterslash = true;
        }
        if(repeatcount > 0) --repeatcount;
        s = lastitem;
        return true;
    }

    seInternal *_internal;
    std::string _filename;
    std::string codefile;
    int codeline;
    std::ifstream f;
    int line;
    std::string lastitem;
    int32_t repeatcount;
    bool afterslash, atlinestart;
};

} // namespace seaecho
