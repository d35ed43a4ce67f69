// pegvm - PE grammar to virtual machine bytecode compiler in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PEGVM_INCLUDE_PEGVM_ERROR_HPP
#define PEGVM_INCLUDE_PEGVM_ERROR_HPP

#include <stdexcept>
#include <string>

namespace pegvm {

class pegvm_error : public std::runtime_error { using std::runtime_error::runtime_error; };
class no_rule_error : public pegvm_error { public: no_rule_error() : pegvm_error{"grammar has no rule"} {} };
class duplicate_rule_error : public pegvm_error { public: explicit duplicate_rule_error(std::string const& name) : pegvm_error{"rule " + name + " is defined more than once"} {} };
class undefined_rule_error : public pegvm_error { public: explicit undefined_rule_error(std::string const& name) : pegvm_error{"rule " + name + " is not defined"} {} };
class encoding_arity_error : public pegvm_error { public: explicit encoding_arity_error(std::string const& op) : pegvm_error{"invalid number of operands for opcode " + op} {} };
class bad_encoding : public pegvm_error { public: bad_encoding() : pegvm_error{"malformed instruction encoding"} {} };
class program_limit_error : public pegvm_error { public: program_limit_error() : pegvm_error{"length or offset of program exceeds internal limit"} {} };
class resource_limit_error : public pegvm_error { public: resource_limit_error() : pegvm_error{"number of resources exceeds internal limit"} {} };
class reenterant_parse_error : public pegvm_error { public: reenterant_parse_error() : pegvm_error{"parsing is non-reenterant"} {} };
class bad_opcode : public pegvm_error { public: bad_opcode() : pegvm_error{"invalid opcode"} {} };
class bad_operand : public pegvm_error { public: bad_operand() : pegvm_error{"instruction operand out of range"} {} };
class bad_stack : public pegvm_error { public: bad_stack() : pegvm_error{"invalid or unbalanced machine stack"} {} };
class bad_character_class : public pegvm_error { public: explicit bad_character_class(std::string const& pattern) : pegvm_error{"invalid character class " + pattern} {} };
class bad_character_range : public bad_character_class { public: explicit bad_character_range(std::string const& pattern) : bad_character_class{pattern + " (character range is reversed)"} {} };
class unbound_thunk_error : public pegvm_error { public: explicit unbound_thunk_error(std::string const& code) : pegvm_error{"no callable bound to thunk {" + code + "}"} {} };
class unbound_label_error : public pegvm_error { public: explicit unbound_label_error(std::string const& name) : pegvm_error{"label " + name + " is not bound in this scope"} {} };

} // namespace pegvm

#endif
