// pegvm - PE grammar to virtual machine bytecode compiler in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PEGVM_INCLUDE_PEGVM_PEGVM_HPP
#define PEGVM_INCLUDE_PEGVM_PEGVM_HPP

#include <pegvm/error.hpp>
#include <pegvm/instruction.hpp>
#include <pegvm/grammar.hpp>
#include <pegvm/program.hpp>
#include <pegvm/tables.hpp>
#include <pegvm/generator.hpp>
#include <pegvm/machine.hpp>

#endif
