#pragma once

int cmd_sections(int argc, char** argv);
