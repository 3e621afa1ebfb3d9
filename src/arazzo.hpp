#pragma once

#include <emit/emitter.hpp>
#include <emit/writer.hpp>
#include <model/descriptors.hpp>
#include <model/exceptions.hpp>
#include <model/literals.hpp>
#include <parse/document.hpp>
