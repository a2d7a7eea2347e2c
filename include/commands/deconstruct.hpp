#pragma once

int cmd_deconstruct(int argc, char** argv);
