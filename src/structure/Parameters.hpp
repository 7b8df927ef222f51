#pragma once
#include <iostream>
#include <cstring>
#include <string>

using namespace std;

class Parameters{
    private:
        bool use_bg = false;
        bool invert = false;
        bool dither = false;
        bool color_test = false;
        bool arg_okay = true;
        bool show_help = false;
        bool verbose = false;
        int width = 80;
        int jobs = 1;
        string image = "";
        string render_path = "";
    public:
        Parameters(int argc, char* argv[]);

        void print_args();

        bool is_valid_number(const std::string& str, int min, int max);

        // get, set
        string get_image(){
            return image;
        }
        int get_width(){
            return width;
        }
        int get_jobs(){
            return jobs;
        }
        bool get_bg(){
            return use_bg;
        }
        bool get_invert(){
            return invert;
        }
        bool get_dither(){
            return dither;
        }
        bool get_color_test(){
            return color_test;
        }
        bool get_verbose(){
            return verbose;
        }
        bool get_show_help(){
            return show_help;
        }
        bool check_arg_okay(){
            return arg_okay;
        }
        string get_render_path(){
            return render_path;
        }
};

void print_help();
