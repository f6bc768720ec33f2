/*****************************************************************
 * File:      DslParser.cpp
 * Category:  src/Sequence
 *
 * Purpose:
 *    Show DSL line parser.
 *****************************************************************/

#include "DslParser.hpp"

#include <errno.h>
#include <stdlib.h>

namespace dmxseq::sequence::dsl{

namespace{

bool isBlank(char c){
  return c == ' ' || c == '\t' || c == '\f' || c == '\v' || c == '\r';
}

bool isIdentStart(char c){
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool isIdentChar(char c){
  return isIdentStart(c) || (c >= '0' && c <= '9');
}

std::string trim(const std::string& s){
  size_t begin = 0;
  size_t end = s.size();
  while(begin < end && isBlank(s[begin])) begin++;
  while(end > begin && isBlank(s[end - 1])) end--;
  return s.substr(begin, end - begin);
}

/** Skip a quoted string starting at s[pos]
 * @return index just past the closing quote, or npos if unterminated
 */
size_t skipString(const std::string& s, size_t pos){
  const char quote = s[pos++];
  while(pos < s.size()){
    if(s[pos] == '\\'){
      pos += 2;
      continue;
    }
    if(s[pos] == quote) return pos + 1;
    pos++;
  }
  return std::string::npos;
}

/** Remove a '#' comment that is not inside a string literal */
std::string stripComment(const std::string& line){
  size_t pos = 0;
  while(pos < line.size()){
    const char c = line[pos];
    if(c == '"' || c == '\''){
      pos = skipString(line, pos);
      if(pos == std::string::npos) return line;
      continue;
    }
    if(c == '#') return line.substr(0, pos);
    pos++;
  }
  return line;
}

/** Decode a quoted literal starting at s[*pos]
 * @return false if the string is unterminated
 */
bool readString(const std::string& s, size_t* pos, Literal* out){
  const size_t start = *pos;
  const char quote = s[start];
  std::string text;
  size_t i = start + 1;

  while(i < s.size()){
    char c = s[i];
    if(c == quote){
      out->kind = Literal::Kind::STRING;
      out->text = text;
      out->raw = s.substr(start, i + 1 - start);
      *pos = i + 1;
      return true;
    }
    if(c == '\\' && i + 1 < s.size()){
      char next = s[i + 1];
      switch(next){
        case '\\': text += '\\'; break;
        case '\'': text += '\''; break;
        case '"':  text += '"';  break;
        case 'n':  text += '\n'; break;
        case 't':  text += '\t'; break;
        default:
          text += '\\';
          text += next;
          break;
      }
      i += 2;
      continue;
    }
    text += c;
    i++;
  }
  return false;
}

bool isNumberSpelling(const std::string& raw){
  bool digit = false;
  for(char c : raw){
    if(c >= '0' && c <= '9'){
      digit = true;
    }else if(c != '+' && c != '-' && c != '.' && c != 'e' && c != 'E'){
      return false;
    }
  }
  return digit;
}

bool isIntegerSpelling(const std::string& raw){
  size_t i = 0;
  if(i < raw.size() && (raw[i] == '+' || raw[i] == '-')) i++;
  if(i == raw.size()) return false;
  for(; i < raw.size(); i++){
    if(raw[i] < '0' || raw[i] > '9') return false;
  }
  return true;
}

Literal classify(const std::string& raw){
  Literal lit;
  lit.raw = raw;

  if(isIntegerSpelling(raw)){
    errno = 0;
    // Overflow saturates; the range checks report it
    long long value = strtoll(raw.c_str(), nullptr, 10);
    lit.kind = Literal::Kind::INTEGER;
    lit.integer = static_cast<int64_t>(value);
    lit.number = static_cast<double>(value);
    return lit;
  }

  if(isNumberSpelling(raw)){
    char* end = nullptr;
    double value = strtod(raw.c_str(), &end);
    if(end && *end == '\0'){
      lit.kind = Literal::Kind::NUMBER;
      lit.number = value;
      return lit;
    }
  }

  lit.kind = Literal::Kind::INVALID;
  return lit;
}

void skipBlanks(const std::string& s, size_t* pos){
  while(*pos < s.size() && isBlank(s[*pos])) (*pos)++;
}

} // namespace

// ============================================================
// Public API
// ============================================================

std::vector<std::string> splitLines(const std::string& text){
  std::vector<std::string> lines;
  size_t start = 0;
  while(true){
    size_t nl = text.find('\n', start);
    std::string line = text.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
    if(!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(line);
    if(nl == std::string::npos) break;
    start = nl + 1;
  }
  return lines;
}

ParsedLine parseLine(const std::string& line){
  ParsedLine parsed;
  const std::string s = trim(stripComment(line));
  parsed.statement = s;

  if(s.empty()){
    parsed.kind = ParsedLine::Kind::BLANK;
    return parsed;
  }

  parsed.kind = ParsedLine::Kind::MALFORMED;

  size_t pos = 0;
  if(!isIdentStart(s[pos])) return parsed;
  while(pos < s.size() && isIdentChar(s[pos])) pos++;
  std::string name = s.substr(0, pos);

  skipBlanks(s, &pos);
  if(pos >= s.size() || s[pos] != '(') return parsed;
  pos++;

  std::vector<Literal> args;
  skipBlanks(s, &pos);

  if(pos < s.size() && s[pos] == ')'){
    pos++;
  }else{
    while(true){
      skipBlanks(s, &pos);
      if(pos >= s.size()) return parsed;

      if(s[pos] == '"' || s[pos] == '\''){
        Literal lit;
        if(!readString(s, &pos, &lit)) return parsed;
        args.push_back(lit);
      }else{
        // Anything up to the next top-level ',' or ')'
        const size_t start = pos;
        int depth = 0;
        while(pos < s.size()){
          const char c = s[pos];
          if(c == '"' || c == '\''){
            pos = skipString(s, pos);
            if(pos == std::string::npos) return parsed;
            continue;
          }
          if(c == '(') depth++;
          if(c == ')'){
            if(depth == 0) break;
            depth--;
          }
          if(c == ',' && depth == 0) break;
          pos++;
        }
        std::string raw = trim(s.substr(start, pos - start));
        if(raw.empty()) return parsed;
        args.push_back(classify(raw));
      }

      skipBlanks(s, &pos);
      if(pos >= s.size()) return parsed;
      if(s[pos] == ','){
        pos++;
        continue;
      }
      if(s[pos] == ')'){
        pos++;
        break;
      }
      return parsed;
    }
  }

  skipBlanks(s, &pos);
  if(pos != s.size()) return parsed;

  parsed.kind = ParsedLine::Kind::CALL;
  parsed.name = name;
  parsed.args = args;
  return parsed;
}

} // namespace dmxseq::sequence::dsl
