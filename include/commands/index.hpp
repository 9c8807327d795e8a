#pragma once

int cmd_index(int argc, char** argv);
