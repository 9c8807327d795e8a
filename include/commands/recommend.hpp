#pragma once

int cmd_recommend(int argc, char** argv);
