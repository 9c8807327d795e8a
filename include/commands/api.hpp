#pragma once

int cmd_api(int argc, char** argv);
