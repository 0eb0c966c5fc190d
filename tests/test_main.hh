#pragma once

extern bool tests_verbose;
