#pragma once

#include "rtweekend.hpp"

#include <string>

//every tunable of the viewer, defaults match the cherry blossom biome
struct render_settings {
	//image settings
	int image_width = 600;   //framebuffer width in pixels
	int image_height = 450;  //framebuffer height in pixels
	double fov = pi / 3.0;   //field of view

	//camera settings
	point3 lookfrom = point3(0.0, 5.0, 35.0); //starting eye
	point3 lookat = point3(0.0, 0.0, 0.0);    //orbit target
	vec3 vup = vec3(0.0, 1.0, 0.0);           //camera-relative "up" direction
	double rotation_speed = pi / 10.0;        //orbit step per key press, radians

	//scene settings
	double voxel_size = 3.75;
	double skybox_size = 100.0;
	std::string texture_dir = "assets/textures/";

	//frame loop
	int frames = 20;                //frames to render
	std::string key_script = "LLLLLLLLLL"; //one key per frame, cycled
	std::string output_prefix = "frame_";  //frames are written as <prefix>NNN.png
	int num_threads = 0;            //0 = one thread per core
	bool show_progress = true;
};
